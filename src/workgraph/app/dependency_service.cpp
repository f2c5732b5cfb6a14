#include "workgraph/app/dependency_service.hpp"

#include "workgraph/graph/readiness.hpp"
#include "workgraph/util/log.hpp"

namespace workgraph {

DependencyService::DependencyService(ITaskStore& store, ServiceOptions options)
    : store_(store), options_(options) {
}

auto DependencyService::persist(const Snapshot& updated,
                                const std::vector<DependencyChange>& changes)
    -> Result<bool> {
  if (changes.empty()) {
    return false;
  }

  Result<void> r = ok();
  if (changes.size() == 1) {
    const auto& change = changes.front();
    DependencyUpdate update{.dependencies = change.dependencies};
    if (const auto* malformed = updated.malformed_of(change.owner)) {
      update.malformed = *malformed;
    }
    r = store_.apply_partial_update(change.owner, update);
  } else {
    r = store_.bulk_rewrite(updated);
  }

  if (!r) {
    if (r.error() == Error::Unsupported) {
      log::warn("Store '{}' cannot persist {} change(s); nothing written",
                store_.name(), changes.size());
      return false;
    }
    log::error("Failed to persist {} change(s) to store '{}': {}",
               changes.size(), store_.name(), r.error().message());
    return std::unexpected(r.error());
  }

  store_.regenerate_derived_artifacts();
  log::debug("Persisted {} change(s) to store '{}'", changes.size(),
             store_.name());
  return true;
}

auto DependencyService::validate() -> Result<ValidationReport> {
  auto snapshot = store_.fetch_all();
  if (!snapshot) {
    return std::unexpected(snapshot.error());
  }

  ValidationReport report{.summary = summarize(*snapshot),
                          .issues = validate_all(*snapshot)};
  if (report.valid()) {
    log::info("Dependency graph is valid ({} items, {} subtasks, {} "
              "dependencies)",
              report.summary.items, report.summary.subitems,
              report.summary.dependencies);
  } else {
    log::warn("Found {} dependency issue(s)", report.issues.size());
  }
  return report;
}

auto DependencyService::add(const Reference& owner, const Reference& target)
    -> Result<MutationReport> {
  auto snapshot = store_.fetch_all();
  if (!snapshot) {
    return std::unexpected(snapshot.error());
  }

  auto mutation = add_dependency(*snapshot, owner, target);
  if (!mutation) {
    log::error("Cannot add dependency {} -> {}: {}", owner, target,
               mutation.error().message());
    return std::unexpected(mutation.error());
  }

  MutationReport report{.mutation = std::move(*mutation)};
  if (!report.mutation.changed()) {
    log::info("{} already depends on {}", owner_label(owner), target);
    return report;
  }

  auto persisted = persist(
      *snapshot, {DependencyChange{owner, report.mutation.dependencies}});
  if (!persisted) {
    return std::unexpected(persisted.error());
  }
  report.persisted = *persisted;
  log::info("Added dependency {} -> {}", owner, target);
  return report;
}

auto DependencyService::remove(const Reference& owner, const Reference& target)
    -> Result<MutationReport> {
  auto snapshot = store_.fetch_all();
  if (!snapshot) {
    return std::unexpected(snapshot.error());
  }

  auto mutation = remove_dependency(*snapshot, owner, target);
  if (!mutation) {
    log::error("Cannot remove dependency {} -> {}: {}", owner, target,
               mutation.error().message());
    return std::unexpected(mutation.error());
  }

  MutationReport report{.mutation = std::move(*mutation)};
  if (!report.mutation.changed()) {
    log::info("{} does not depend on {}", owner_label(owner), target);
    return report;
  }

  auto persisted = persist(
      *snapshot, {DependencyChange{owner, report.mutation.dependencies}});
  if (!persisted) {
    return std::unexpected(persisted.error());
  }
  report.persisted = *persisted;
  log::info("Removed dependency {} -> {}", owner, target);
  return report;
}

auto DependencyService::run_bulk(std::string_view task_spec,
                                 std::string_view dependency_spec,
                                 BulkKind kind, bool dry_run)
    -> Result<BulkReport> {
  auto snapshot = store_.fetch_all();
  if (!snapshot) {
    return std::unexpected(snapshot.error());
  }

  auto report = apply_bulk(*snapshot, BulkRequest{
                                          .task_spec = task_spec,
                                          .dependency_spec = dependency_spec,
                                          .kind = kind,
                                          .dry_run = dry_run,
                                          .max_range_size =
                                              options_.max_range_size,
                                      });
  if (!report) {
    log::error("Invalid range '{}' x '{}': {}", task_spec, dependency_spec,
               report.error().message());
    return std::unexpected(report.error());
  }

  if (dry_run) {
    log::info("Dry run: {} operation(s) would be applied, {} error(s)",
              report->summary.valid_operations, report->summary.errors);
    return report;
  }

  auto updated = std::move(*snapshot);
  for (const auto& change : report->changes) {
    if (auto* deps = updated.mutable_dependencies(change.owner)) {
      *deps = change.dependencies;
    }
  }

  auto persisted = persist(updated, report->changes);
  if (!persisted) {
    return std::unexpected(persisted.error());
  }
  if (*persisted) {
    report->summary.operations_performed = report->summary.valid_operations;
  }

  log::info("Bulk {}: {} applied, {} persisted, {} error(s)",
            kind == BulkKind::Add ? "add" : "remove",
            report->summary.valid_operations,
            report->summary.operations_performed, report->summary.errors);
  return report;
}

auto DependencyService::add_range(std::string_view task_spec,
                                  std::string_view dependency_spec,
                                  bool dry_run) -> Result<BulkReport> {
  return run_bulk(task_spec, dependency_spec, BulkKind::Add, dry_run);
}

auto DependencyService::remove_range(std::string_view task_spec,
                                     std::string_view dependency_spec,
                                     bool dry_run) -> Result<BulkReport> {
  return run_bulk(task_spec, dependency_spec, BulkKind::Remove, dry_run);
}

auto DependencyService::fix() -> Result<FixResult> {
  auto snapshot = store_.fetch_all();
  if (!snapshot) {
    return std::unexpected(snapshot.error());
  }

  FixResult result{.report = fix_dependencies(*snapshot)};
  const auto& stats = result.report.stats;
  if (!result.report.changed()) {
    log::info("No dependency issues to fix");
    return result;
  }

  auto persisted = persist(result.report.fixed, result.report.changes);
  if (!persisted) {
    return std::unexpected(persisted.error());
  }
  result.persisted = *persisted;

  log::info("Fixed dependencies: {} removed, {} usability reset(s) across {} "
            "item(s) and {} subtask(s)",
            stats.total_removed(), stats.usability_resets, stats.items_fixed,
            stats.subitems_fixed);
  return result;
}

auto DependencyService::next() -> Result<std::optional<Item>> {
  auto snapshot = store_.fetch_all();
  if (!snapshot) {
    return std::unexpected(snapshot.error());
  }

  auto item = find_next(*snapshot);
  if (item) {
    log::debug("Next eligible item: {}", item->id);
  } else {
    log::debug("No eligible item");
  }
  return item;
}

}  // namespace workgraph
