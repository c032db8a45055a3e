#pragma once

#include "pqm/error.hpp"
#include "pqm/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace pqm {

// ============================================================================
// Resolution Results
// ============================================================================

// A needed name that no script defines, with the scripts that require it
struct UnresolvedName {
    std::string name;
    std::vector<std::string> missing_from;  // empty when the name was requested directly
};

struct ResolveOptions {
    // Omit unresolved names from the order and report them instead of failing
    bool allow_partial = false;
};

struct ResolvedOrder {
    std::vector<std::string> order;         // dependencies before dependents
    std::vector<UnresolvedName> unresolved; // only populated with allow_partial
};

struct DependencyTreeNode {
    std::string name;
    bool resolved = true;
    std::vector<DependencyTreeNode> children;
};

// ============================================================================
// Dependency Graph
// ============================================================================

/**
 * @brief Directed "requires" graph over script names
 *
 * Edge A -> B means A requires B to be present before A. Names referenced
 * as dependencies but never defined are kept as unresolved nodes. Nodes are
 * keyed by folded name; output uses the declared spelling.
 */
class DependencyGraph {
public:
    DependencyGraph() = default;

    static DependencyGraph build(const std::vector<ScriptRecord>& records);
    static DependencyGraph build(const std::vector<IndexEntry>& entries);

    /**
     * @brief Insertion order for the transitive closure of `roots`
     *
     * Depth-first from each root in the given order, dependencies in declared
     * order; a name is emitted after all of its dependencies. Each name appears
     * once.
     *
     * Errors:
     * - CYCLE_DETECTED: related() holds the cycle starting at the revisited node
     * - UNRESOLVED_DEPENDENCY: subject() is the missing name, related() the
     *   scripts requiring it, empty for an unknown root nobody references
     *   (only when allow_partial is false)
     */
    Result<ResolvedOrder> resolve_order(const std::vector<std::string>& roots,
                                        const ResolveOptions& options = {}) const;

    bool contains(const std::string& name) const;
    bool is_resolved(const std::string& name) const;

    // Names referenced somewhere but defined nowhere, sorted
    std::vector<std::string> unresolved_names() const;

    // Scripts that directly require `name`, sorted
    std::vector<std::string> dependents_of(const std::string& name) const;

    // Declared dependencies as a tree; repeated names on a path are not expanded
    DependencyTreeNode dependency_tree(const std::string& name) const;

    size_t node_count() const { return nodes_.size(); }
    size_t edge_count() const;

private:
    struct Node {
        std::string name;                 // declared spelling
        bool resolved = false;
        std::vector<std::string> dependencies;  // folded keys, declared order
        std::vector<std::string> required_by;   // folded keys
    };

    void add_script(const std::string& name, const std::vector<std::string>& dependencies);

    std::unordered_map<std::string, Node> nodes_;  // keyed by folded name
};

// ============================================================================
// Dependency Suggestions
// ============================================================================

// Scan `body` for call-like uses of `known_names` ("Name(" or #"Name"( forms),
// skipping comments and string literals. `self_name` is never suggested.
// Advisory only: the caller owns the final dependency list.
std::vector<std::string> suggest_dependencies(const std::string& body,
                                              const std::vector<std::string>& known_names,
                                              const std::string& self_name = "");

} // namespace pqm
