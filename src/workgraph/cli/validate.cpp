#include "workgraph/cli/commands.hpp"
#include "workgraph/cli/session.hpp"

#include <fmt/format.h>

namespace workgraph::cli {

auto cmd_validate(const CommonOptions& common) -> int {
  auto session = open_session(common);
  if (!session) {
    fmt::print(stderr, "Error: {}\n", session.error().message());
    return 1;
  }

  auto result = session->service->validate();
  if (!result) {
    fmt::print(stderr, "Error: {}\n", result.error().message());
    return 1;
  }
  const auto& report = *result;

  fmt::print("Checked {} tasks, {} subtasks, {} dependencies\n",
             report.summary.items, report.summary.subitems,
             report.summary.dependencies);

  if (report.valid()) {
    fmt::print("✓ No dependency issues found\n");
    return 0;
  }

  fmt::print("\n{:<10} {:<10} {:<10} {}\n", "KIND", "OWNER", "DEPENDENCY",
             "MESSAGE");
  for (const auto& issue : report.issues) {
    fmt::print("{:<10} {:<10} {:<10} {}\n", issue_kind_name(issue.kind),
               issue.owner.to_string(),
               issue.dependency ? issue.dependency->to_string() : "-",
               issue.message);
  }
  fmt::print("\n✗ {} issue(s) found. Run 'workgraph fix' to repair.\n",
             report.issues.size());
  return 1;
}

}  // namespace workgraph::cli
