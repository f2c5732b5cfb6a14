#include "workgraph/cli/commands.hpp"
#include "workgraph/cli/session.hpp"

#include <fmt/format.h>

namespace workgraph::cli {

auto cmd_fix(const CommonOptions& common) -> int {
  auto session = open_session(common);
  if (!session) {
    fmt::print(stderr, "Error: {}\n", session.error().message());
    return 1;
  }

  auto result = session->service->fix();
  if (!result) {
    fmt::print(stderr, "Error: {}\n", result.error().message());
    return 1;
  }
  const auto& report = result->report;
  const auto& stats = report.stats;

  if (!report.changed()) {
    fmt::print("✓ No changes needed\n");
  } else {
    fmt::print("{:<28} {}\n", "Duplicates removed", stats.duplicates_removed);
    fmt::print("{:<28} {}\n", "Missing targets removed",
               stats.missing_removed);
    fmt::print("{:<28} {}\n", "Self dependencies removed",
               stats.self_removed);
    fmt::print("{:<28} {}\n", "Circular edges removed", stats.cycles_broken);
    fmt::print("{:<28} {}\n", "Subtasks made independent",
               stats.usability_resets);
    fmt::print("{:<28} {}\n", "Tasks updated", stats.items_fixed);
    fmt::print("{:<28} {}\n", "Subtasks updated", stats.subitems_fixed);
    if (!result->persisted) {
      fmt::print("\nStore '{}' did not accept the changes; nothing saved\n",
                 session->store->name());
    }
  }

  if (!report.unresolved_cycles.empty()) {
    fmt::print("\nCircular dependencies left for manual repair:\n");
    for (const auto& ref : report.unresolved_cycles) {
      fmt::print("  {}\n", ref);
    }
  }
  return 0;
}

}  // namespace workgraph::cli
