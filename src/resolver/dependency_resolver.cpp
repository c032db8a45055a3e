#include "pqm/dependency_resolver.hpp"

#include <algorithm>
#include <optional>
#include <unordered_set>

namespace pqm {

namespace {

enum class Mark {
    Unvisited,
    InProgress,
    Done
};

bool less_folded(const std::string& a, const std::string& b) {
    std::string fa = fold_name(a);
    std::string fb = fold_name(b);
    if (fa != fb) return fa < fb;
    return a < b;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

DependencyGraph DependencyGraph::build(const std::vector<ScriptRecord>& records) {
    DependencyGraph graph;
    for (const auto& record : records) {
        graph.add_script(record.meta.name, record.meta.dependencies);
    }
    return graph;
}

DependencyGraph DependencyGraph::build(const std::vector<IndexEntry>& entries) {
    DependencyGraph graph;
    for (const auto& entry : entries) {
        graph.add_script(entry.meta.name, entry.meta.dependencies);
    }
    return graph;
}

void DependencyGraph::add_script(const std::string& name,
                                 const std::vector<std::string>& dependencies) {
    std::string key = fold_name(name);
    Node& node = nodes_[key];
    if (node.resolved) {
        // Duplicate definitions are rejected by the index; the first one wins here
        return;
    }
    node.name = name;
    node.resolved = true;

    for (const auto& dep : dependencies) {
        std::string dep_key = fold_name(dep);
        if (std::find(node.dependencies.begin(), node.dependencies.end(), dep_key) !=
            node.dependencies.end()) {
            continue;
        }
        node.dependencies.push_back(dep_key);

        // References to unordered_map elements survive rehashing
        Node& target = nodes_[dep_key];
        if (target.name.empty()) target.name = dep;
        target.required_by.push_back(key);
    }
}

// ============================================================================
// Queries
// ============================================================================

bool DependencyGraph::contains(const std::string& name) const {
    return nodes_.count(fold_name(name)) > 0;
}

bool DependencyGraph::is_resolved(const std::string& name) const {
    auto it = nodes_.find(fold_name(name));
    return it != nodes_.end() && it->second.resolved;
}

std::vector<std::string> DependencyGraph::unresolved_names() const {
    std::vector<std::string> result;
    for (const auto& [key, node] : nodes_) {
        if (!node.resolved) result.push_back(node.name);
    }
    std::sort(result.begin(), result.end(), less_folded);
    return result;
}

std::vector<std::string> DependencyGraph::dependents_of(const std::string& name) const {
    std::vector<std::string> result;
    auto it = nodes_.find(fold_name(name));
    if (it == nodes_.end()) return result;
    for (const auto& key : it->second.required_by) {
        result.push_back(nodes_.at(key).name);
    }
    std::sort(result.begin(), result.end(), less_folded);
    return result;
}

size_t DependencyGraph::edge_count() const {
    size_t count = 0;
    for (const auto& [key, node] : nodes_) {
        count += node.dependencies.size();
    }
    return count;
}

DependencyTreeNode DependencyGraph::dependency_tree(const std::string& name) const {
    std::unordered_set<std::string> on_path;

    struct Builder {
        const std::unordered_map<std::string, Node>& nodes;
        std::unordered_set<std::string>& on_path;

        DependencyTreeNode make(const std::string& key, const std::string& fallback) {
            DependencyTreeNode tree;
            auto it = nodes.find(key);
            if (it == nodes.end()) {
                tree.name = fallback;
                tree.resolved = false;
                return tree;
            }
            tree.name = it->second.name;
            tree.resolved = it->second.resolved;
            if (!on_path.insert(key).second) {
                return tree;
            }
            for (const auto& dep : it->second.dependencies) {
                tree.children.push_back(make(dep, dep));
            }
            on_path.erase(key);
            return tree;
        }
    };

    Builder builder{nodes_, on_path};
    return builder.make(fold_name(name), name);
}

// ============================================================================
// Topological Ordering
// ============================================================================

Result<ResolvedOrder> DependencyGraph::resolve_order(const std::vector<std::string>& roots,
                                                     const ResolveOptions& options) const {
    std::unordered_map<std::string, Mark> marks;
    std::vector<std::string> path;  // folded keys of the current DFS path
    std::unordered_set<std::string> reported_unresolved;
    ResolvedOrder out;
    std::optional<Error> failure;

    auto display_names = [this](const std::vector<std::string>& keys) {
        std::vector<std::string> names;
        for (const auto& k : keys) names.push_back(nodes_.at(k).name);
        std::sort(names.begin(), names.end(), less_folded);
        return names;
    };

    struct Walker {
        const DependencyGraph& graph;
        const ResolveOptions& options;
        std::unordered_map<std::string, Mark>& marks;
        std::vector<std::string>& path;
        std::unordered_set<std::string>& reported_unresolved;
        ResolvedOrder& out;
        std::optional<Error>& failure;
        const decltype(display_names)& names_of;

        bool visit(const std::string& key, const std::string& spelled) {
            auto it = graph.nodes_.find(key);
            if (it == graph.nodes_.end() || !it->second.resolved) {
                std::string name = (it == graph.nodes_.end()) ? spelled : it->second.name;
                std::vector<std::string> missing_from;
                if (it != graph.nodes_.end()) missing_from = names_of(it->second.required_by);

                if (!options.allow_partial) {
                    failure = Error(ErrorCode::UNRESOLVED_DEPENDENCY,
                                    "unresolved dependency: " + name, name, missing_from);
                    return false;
                }
                if (reported_unresolved.insert(key).second) {
                    out.unresolved.push_back(UnresolvedName{name, missing_from});
                }
                return true;
            }

            Mark& mark = marks[key];
            if (mark == Mark::Done) return true;
            if (mark == Mark::InProgress) {
                auto start = std::find(path.begin(), path.end(), key);
                std::vector<std::string> cycle;
                std::string description;
                for (auto p = start; p != path.end(); ++p) {
                    cycle.push_back(graph.nodes_.at(*p).name);
                    description += cycle.back() + " -> ";
                }
                description += it->second.name;
                failure = Error(ErrorCode::CYCLE_DETECTED,
                                "circular dependency: " + description, it->second.name, cycle);
                return false;
            }

            mark = Mark::InProgress;
            path.push_back(key);
            for (const auto& dep : it->second.dependencies) {
                if (!visit(dep, dep)) return false;
            }
            path.pop_back();
            marks[key] = Mark::Done;
            out.order.push_back(it->second.name);
            return true;
        }
    };

    Walker walker{*this, options, marks, path, reported_unresolved, out, failure, display_names};
    for (const auto& root : roots) {
        if (!walker.visit(fold_name(root), root)) {
            return Result<ResolvedOrder>::err(*failure);
        }
    }

    return Result<ResolvedOrder>::ok(std::move(out));
}

} // namespace pqm
