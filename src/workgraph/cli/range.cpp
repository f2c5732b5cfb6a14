#include "workgraph/cli/commands.hpp"
#include "workgraph/cli/session.hpp"

#include <fmt/format.h>

namespace workgraph::cli {

namespace {

auto print_report(const BulkReport& report) -> void {
  fmt::print("{:<10} {:<12} {:<10} {}\n", "TASK", "DEPENDENCY", "OUTCOME",
             "ERROR");
  for (const auto& op : report.operations) {
    fmt::print("{:<10} {:<12} {:<10} {}\n", op.task.to_string(),
               op.dependency.to_string(), pair_outcome_name(op.outcome),
               op.error ? op.error.message() : "");
  }

  const auto& s = report.summary;
  if (report.dry_run) {
    fmt::print("\nDry run: {} operation(s) would be applied, {} error(s)\n",
               s.valid_operations, s.errors);
  } else {
    fmt::print("\n{} valid, {} performed, {} error(s)\n", s.valid_operations,
               s.operations_performed, s.errors);
  }
}

auto run_range(const CommonOptions& common, const RangeOptions& opts,
               BulkKind kind) -> int {
  auto session = open_session(common);
  if (!session) {
    fmt::print(stderr, "Error: {}\n", session.error().message());
    return 1;
  }

  auto& service = *session->service;
  auto result = kind == BulkKind::Add
                    ? service.add_range(opts.tasks, opts.dependencies,
                                        opts.dry_run)
                    : service.remove_range(opts.tasks, opts.dependencies,
                                           opts.dry_run);
  if (!result) {
    fmt::print(stderr, "Error: {}\n", result.error().message());
    return 1;
  }
  print_report(*result);
  return 0;
}

}  // namespace

auto cmd_add_range(const CommonOptions& common, const RangeOptions& opts)
    -> int {
  return run_range(common, opts, BulkKind::Add);
}

auto cmd_remove_range(const CommonOptions& common, const RangeOptions& opts)
    -> int {
  return run_range(common, opts, BulkKind::Remove);
}

}  // namespace workgraph::cli
