#include "workgraph/graph/bulk_operator.hpp"

#include "workgraph/graph/dependency_mutator.hpp"
#include "workgraph/util/log.hpp"

#include <algorithm>

namespace workgraph {

namespace {

auto record_change(std::vector<DependencyChange>& changes,
                   const Mutation& mutation) -> void {
  auto it = std::ranges::find_if(changes, [&](const DependencyChange& c) {
    return c.owner == mutation.owner;
  });
  if (it == changes.end()) {
    changes.push_back(DependencyChange{mutation.owner, mutation.dependencies});
  } else {
    it->dependencies = mutation.dependencies;
  }
}

}  // namespace

auto apply_bulk(const Snapshot& snapshot, const BulkRequest& request)
    -> Result<BulkReport> {
  auto tasks = parse_range_spec(request.task_spec, request.max_range_size);
  if (!tasks) {
    log::debug("Invalid task range '{}'", request.task_spec);
    return fail(tasks.error());
  }
  auto deps = parse_range_spec(request.dependency_spec, request.max_range_size);
  if (!deps) {
    log::debug("Invalid dependency range '{}'", request.dependency_spec);
    return fail(deps.error());
  }

  BulkReport report;
  report.dry_run = request.dry_run;
  report.operations.reserve(tasks->size() * deps->size());

  Snapshot working = snapshot;

  for (const auto& task : *tasks) {
    for (const auto& dep : *deps) {
      BulkOperation op{task, dep, PairOutcome::Applied, {}};

      auto mutation = request.kind == BulkKind::Add
                          ? add_dependency(working, task, dep)
                          : remove_dependency(working, task, dep);
      if (!mutation) {
        op.outcome = PairOutcome::Error;
        op.error = mutation.error();
        ++report.summary.errors;
      } else if (!mutation->changed()) {
        op.outcome = PairOutcome::SkippedNoOp;
      } else if (auto r = apply(working, *mutation); !r) {
        op.outcome = PairOutcome::Error;
        op.error = r.error();
        ++report.summary.errors;
      } else {
        ++report.summary.valid_operations;
        record_change(report.changes, *mutation);
      }

      log::trace("{} {} -> {}: {}",
                 request.kind == BulkKind::Add ? "add" : "remove", task, dep,
                 pair_outcome_name(op.outcome));
      report.operations.push_back(std::move(op));
    }
  }

  return ok(std::move(report));
}

}  // namespace workgraph
