#include "pqm/manager.hpp"
#include "pqm/digest.hpp"
#include "pqm/metadata.hpp"
#include "pqm/platform.hpp"
#include "pqm/script_record.hpp"

#include <algorithm>
#include <set>
#include <unordered_map>

#include <spdlog/spdlog.h>

namespace pqm {

namespace {

std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

Manager::Manager(std::shared_ptr<RepositoryContext> context)
    : context_(std::move(context)),
      index_(std::make_shared<IndexStore>(context_)),
      storage_(std::make_unique<StorageManager>(context_, index_)) {}

Result<std::unique_ptr<Manager>> Manager::open(const std::string& root) {
    auto loaded = load_repository_config(root);
    for (const auto& w : loaded.warnings) {
        spdlog::warn("{}", w);
    }
    return create(root, loaded.config);
}

Result<std::unique_ptr<Manager>> Manager::create(const std::string& root,
                                                 const RepositoryConfig& config) {
    using R = Result<std::unique_ptr<Manager>>;

    auto context = RepositoryContext::open(root, config);
    if (context.isErr()) return R::err(context.error());

    std::unique_ptr<Manager> manager(new Manager(std::move(context.value())));
    spdlog::debug("Opened repository {} (index: {})", manager->root(),
                  manager->context_->index_path());
    return R::ok(std::move(manager));
}

IndexLoadStatus Manager::index_status() const {
    return index_->load_status();
}

std::string Manager::index_diagnostic() const {
    return index_->load_diagnostic();
}

// ============================================================================
// Index
// ============================================================================

Result<ScanReport> Manager::scan(const CancellationToken& cancel) const {
    auto shared = context_->try_acquire_shared();
    if (shared.isErr()) return Result<ScanReport>::err(shared.error());
    return scan_repository(*context_, cancel);
}

Result<BuildReport> Manager::build_index(const CancellationToken& cancel) {
    using R = Result<BuildReport>;

    auto access = context_->acquire_exclusive();
    if (access.isErr()) return R::err(access.error());

    auto scanned = scan_repository(*context_, cancel);
    if (scanned.isErr()) {
        spdlog::warn("Index build stopped: {}", scanned.error().message());
        return R::err(scanned.error());
    }

    auto& report = scanned.value();
    auto built = index_->build(access.value(), to_index_entries(*context_, report.scripts));
    if (built.isErr()) return R::err(built.error());

    BuildReport result;
    result.indexed = report.scripts.size();
    result.skipped = std::move(report.skipped);
    return R::ok(std::move(result));
}

Result<RefreshReport> Manager::refresh_index(const CancellationToken& cancel) {
    using R = Result<RefreshReport>;

    auto access = context_->acquire_exclusive();
    if (access.isErr()) return R::err(access.error());

    auto scanned = scan_repository(*context_, cancel);
    if (scanned.isErr()) {
        spdlog::warn("Index refresh stopped: {}", scanned.error().message());
        return R::err(scanned.error());
    }

    auto& report = scanned.value();
    auto refreshed = index_->refresh(access.value(), to_index_entries(*context_, report.scripts));
    if (refreshed.isErr()) return R::err(refreshed.error());

    RefreshReport result;
    result.summary = std::move(refreshed.value());
    result.skipped = std::move(report.skipped);
    return R::ok(std::move(result));
}

Result<ConsistencyReport> Manager::check_consistency() const {
    auto shared = context_->try_acquire_shared();
    if (shared.isErr()) return Result<ConsistencyReport>::err(shared.error());
    IndexView view = index_->view(shared.value());

    ConsistencyReport report;
    std::set<std::string> indexed_paths;

    for (const auto& entry : view.entries) {
        indexed_paths.insert(entry.path);
        std::string path = join_path(context_->root(), entry.path);

        if (!is_regular_file(path)) {
            spdlog::warn("Index entry '{}' points at a missing file: {}", entry.meta.name, entry.path);
            report.missing_files.push_back(entry.meta.name);
            continue;
        }

        auto digest = compute_file_sha256(path);
        if (!digest.ok) {
            return Result<ConsistencyReport>::err(
                Error(ErrorCode::IO_ERROR, digest.error, path));
        }
        if (digest.hex_digest != entry.sha256) {
            spdlog::warn("Index entry '{}' is stale: {} changed on disk", entry.meta.name,
                         entry.path);
            report.stale_entries.push_back(entry.meta.name);
        }
    }

    for (const auto& file : list_script_files(*context_)) {
        std::string rel = relative_path(file, context_->root());
        if (indexed_paths.count(rel) == 0) {
            report.unindexed_files.push_back(rel);
        }
    }

    return Result<ConsistencyReport>::ok(std::move(report));
}

// ============================================================================
// Queries
// ============================================================================

std::vector<IndexEntry> Manager::search(const std::string& query) const {
    return index_->search(query);
}

std::optional<IndexEntry> Manager::get(const std::string& name) const {
    return index_->get(name);
}

std::vector<std::string> Manager::list_categories() const {
    return index_->list_categories();
}

std::vector<IndexEntry> Manager::entries() const {
    return index_->entries();
}

Result<ScriptRecord> Manager::read_indexed(const IndexEntry& entry) const {
    std::string path = join_path(context_->root(), entry.path);
    auto loaded = load_script_file(path);
    if (!loaded.ok) {
        ErrorCode code = loaded.error_code == ErrorCode::IO_ERROR ? ErrorCode::NOT_FOUND
                                                                  : loaded.error_code;
        return Result<ScriptRecord>::err(
            Error(code, "cannot load '" + entry.meta.name + "': " + loaded.error, path));
    }
    return Result<ScriptRecord>::ok(std::move(loaded.record));
}

Result<ScriptRecord> Manager::get_script(const std::string& name) const {
    auto shared = context_->try_acquire_shared();
    if (shared.isErr()) return Result<ScriptRecord>::err(shared.error());
    auto entry = index_->get(shared.value(), name);
    if (!entry) {
        return Result<ScriptRecord>::err(
            Error(ErrorCode::NOT_FOUND, "script not in index: " + name, name));
    }
    return read_indexed(*entry);
}

// ============================================================================
// Dependencies
// ============================================================================

std::shared_ptr<const DependencyGraph> Manager::graph_for(const IndexView& view) const {
    std::lock_guard<std::mutex> lock(graph_mutex_);
    if (!graph_ || graph_generation_ != view.generation) {
        graph_ = std::make_shared<const DependencyGraph>(DependencyGraph::build(view.entries));
        graph_generation_ = view.generation;
        spdlog::debug("Dependency graph rebuilt: {} nodes, {} edges", graph_->node_count(),
                      graph_->edge_count());
    }
    return graph_;
}

Result<Resolution> Manager::resolve(const std::vector<std::string>& names,
                                    const ResolveOptions& options) const {
    using R = Result<Resolution>;

    auto shared = context_->try_acquire_shared();
    if (shared.isErr()) return R::err(shared.error());
    IndexView view = index_->view(shared.value());

    auto order = graph_for(view)->resolve_order(names, options);
    if (order.isErr()) return R::err(order.error());

    std::unordered_map<std::string, const IndexEntry*> by_name;
    for (const auto& entry : view.entries) {
        by_name[fold_name(entry.meta.name)] = &entry;
    }

    Resolution resolution;
    resolution.unresolved = std::move(order.value().unresolved);
    for (const auto& name : order.value().order) {
        auto it = by_name.find(fold_name(name));
        if (it == by_name.end()) {
            return R::err(Error(ErrorCode::NOT_FOUND, "script not in index: " + name, name));
        }
        auto record = read_indexed(*it->second);
        if (record.isErr()) return R::err(record.error());
        resolution.scripts.push_back(ResolvedScript{record.value().meta.name,
                                                    record.value().body,
                                                    record.value().meta.description});
    }
    return R::ok(std::move(resolution));
}

Result<std::vector<std::string>> Manager::suggest_dependencies(const std::string& name) const {
    using R = Result<std::vector<std::string>>;

    auto shared = context_->try_acquire_shared();
    if (shared.isErr()) return R::err(shared.error());
    IndexView view = index_->view(shared.value());

    auto entry = index_->get(shared.value(), name);
    if (!entry) return R::err(Error(ErrorCode::NOT_FOUND, "script not in index: " + name, name));

    auto record = read_indexed(*entry);
    if (record.isErr()) return R::err(record.error());

    std::vector<std::string> known;
    known.reserve(view.entries.size());
    for (const auto& e : view.entries) known.push_back(e.meta.name);

    return R::ok(pqm::suggest_dependencies(record.value().body, known, entry->meta.name));
}

Result<std::vector<std::string>> Manager::dependents_of(const std::string& name) const {
    auto graph = graph_for(index_->view());
    if (!graph->contains(name)) {
        return Result<std::vector<std::string>>::err(
            Error(ErrorCode::NOT_FOUND, "unknown script: " + name, name));
    }
    return Result<std::vector<std::string>>::ok(graph->dependents_of(name));
}

Result<DependencyTreeNode> Manager::dependency_tree(const std::string& name) const {
    auto graph = graph_for(index_->view());
    if (!graph->contains(name)) {
        return Result<DependencyTreeNode>::err(
            Error(ErrorCode::NOT_FOUND, "unknown script: " + name, name));
    }
    return Result<DependencyTreeNode>::ok(graph->dependency_tree(name));
}

// ============================================================================
// Edits
// ============================================================================

Result<IndexEntry> Manager::create_script(const ScriptMetadata& metadata, const std::string& body) {
    return storage_->create(ScriptRecord{metadata, body, ""});
}

Result<IndexEntry> Manager::apply_metadata_edit(const std::string& name,
                                                const ScriptMetadata& metadata) {
    return storage_->update_metadata(name, metadata);
}

Result<IndexEntry> Manager::rewrite_script(const std::string& name, const ScriptMetadata& metadata,
                                           const std::string& body) {
    return storage_->rewrite(name, metadata, body);
}

Result<IndexEntry> Manager::update_body(const std::string& name, const std::string& body) {
    return storage_->update_body(name, body);
}

Result<IndexEntry> Manager::relocate(const std::string& name, const std::string& category) {
    return storage_->relocate_on_category_change(name, category);
}

Result<void> Manager::delete_script(const std::string& name) {
    return storage_->remove(name);
}

void Manager::set_transition_observer(TransitionObserver observer) {
    storage_->set_transition_observer(std::move(observer));
}

// ============================================================================
// Documents
// ============================================================================

Result<ExtractionReport> Manager::extract_from_document(DocumentAdapter& adapter,
                                                        const std::string& document,
                                                        const ExtractOptions& options,
                                                        const CancellationToken& cancel) {
    using R = Result<ExtractionReport>;

    auto scripts = adapter.read_scripts(document);
    if (scripts.isErr()) {
        spdlog::error("Reading scripts from {} failed: {}", document, scripts.error().message());
        return R::err(scripts.error());
    }

    std::string category = options.category.empty() ? config().default_category
                                                    : options.category;
    spdlog::info("Extracting {} scripts from {} into '{}'", scripts.value().size(), document,
                 category);

    ExtractionReport report;
    for (const auto& script : scripts.value()) {
        if (cancel.cancelled()) {
            spdlog::warn("Extraction cancelled after {} scripts",
                         report.created.size() + report.overwritten.size());
            report.cancelled = true;
            break;
        }

        std::string name = normalize_scalar(script.name);
        if (index_->get(name)) {
            if (!options.overwrite) {
                report.failed.push_back(ScriptFailure{
                    name, Error(ErrorCode::ALREADY_EXISTS, "script already exists: " + name, name)});
                continue;
            }
            auto updated = storage_->update_body(name, script.body);
            if (updated.isErr()) {
                spdlog::error("Failed to overwrite '{}': {}", name, updated.error().message());
                report.failed.push_back(ScriptFailure{name, updated.error()});
            } else {
                report.overwritten.push_back(updated.value().meta.name);
            }
            continue;
        }

        ScriptMetadata meta;
        meta.name = name;
        meta.category = category;
        meta.tags = {"extracted"};
        meta.description = normalize_scalar(script.description);
        meta.version = kDefaultVersion;

        auto created = storage_->create(ScriptRecord{meta, script.body, ""});
        if (created.isErr()) {
            spdlog::error("Failed to save '{}': {}", name, created.error().message());
            report.failed.push_back(ScriptFailure{name, created.error()});
        } else {
            report.created.push_back(created.value().meta.name);
        }
    }

    spdlog::info("Extraction complete: {} created, {} overwritten, {} failed",
                 report.created.size(), report.overwritten.size(), report.failed.size());
    return R::ok(std::move(report));
}

Result<InsertionReport> Manager::insert_into_document(DocumentAdapter& adapter,
                                                      const std::string& document,
                                                      const std::vector<std::string>& names,
                                                      const InsertOptions& options) const {
    using R = Result<InsertionReport>;

    auto resolved = resolve(names, options.resolve);
    if (resolved.isErr()) {
        spdlog::error("Cannot insert [{}]: {}", join_names(names), resolved.error().message());
        return R::err(resolved.error());
    }

    InsertionReport report;
    report.unresolved = resolved.value().unresolved;
    for (const auto& missing : report.unresolved) {
        spdlog::warn("Skipping unresolved dependency '{}'", missing.name);
    }

    std::vector<std::string> order;
    for (const auto& script : resolved.value().scripts) order.push_back(script.name);
    spdlog::info("Inserting into {}: {}", document, join_names(order));

    for (const auto& script : resolved.value().scripts) {
        auto written = adapter.write_script(document, script.name, script.body, script.description);
        InsertionOutcome outcome{script.name, std::nullopt};
        if (written.isErr()) {
            spdlog::error("Insert '{}' failed: {}", script.name, written.error().message());
            outcome.error = written.error();
        } else {
            spdlog::info("Inserted '{}'", script.name);
        }
        report.outcomes.push_back(std::move(outcome));
    }
    return R::ok(std::move(report));
}

} // namespace pqm
