#include "workgraph/cli/commands.hpp"
#include "workgraph/cli/session.hpp"
#include "workgraph/storage/state_strings.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace workgraph::cli {

auto cmd_next(const CommonOptions& common) -> int {
  auto session = open_session(common);
  if (!session) {
    fmt::print(stderr, "Error: {}\n", session.error().message());
    return 1;
  }

  auto result = session->service->next();
  if (!result) {
    fmt::print(stderr, "Error: {}\n", result.error().message());
    return 1;
  }

  if (!*result) {
    fmt::print("No eligible task. All pending tasks wait on dependencies.\n");
    return 0;
  }

  const auto& item = **result;
  fmt::print("Next task: {} - {}\n", item.id, item.title);
  fmt::print("  status:       {}\n", item_status_name(item.status));
  fmt::print("  priority:     {}\n", priority_name(item.priority));
  if (item.dependencies.empty()) {
    fmt::print("  dependencies: none\n");
  } else {
    fmt::print("  dependencies: {}\n", fmt::join(item.dependencies, ", "));
  }
  if (!item.subtasks.empty()) {
    fmt::print("  subtasks:\n");
    for (const auto& sub : item.subtasks) {
      fmt::print("    {} [{}] {}\n", sub.ref(), item_status_name(sub.status),
                 sub.title);
    }
  }
  return 0;
}

}  // namespace workgraph::cli
