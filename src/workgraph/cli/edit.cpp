#include "workgraph/cli/commands.hpp"
#include "workgraph/cli/session.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace workgraph::cli {

namespace {

struct ParsedEdit {
  Reference owner;
  Reference target;
};

auto parse_edit(const EditOptions& opts) -> Result<ParsedEdit> {
  auto owner = parse_id(opts.owner);
  if (!owner) {
    fmt::print(stderr, "Error: invalid task id '{}'\n", opts.owner);
    return std::unexpected(owner.error());
  }
  auto target = parse_id(opts.target);
  if (!target) {
    fmt::print(stderr, "Error: invalid dependency id '{}'\n", opts.target);
    return std::unexpected(target.error());
  }
  return ParsedEdit{*owner, *target};
}

auto report_mutation(const Session& session, const MutationReport& report)
    -> void {
  const auto& m = report.mutation;
  if (!m.changed()) {
    fmt::print("{}: {} -> {} ({})\n", owner_label(m.owner), m.owner, m.target,
               mutation_outcome_name(m.outcome));
    return;
  }
  fmt::print("{} dependencies: [{}]\n", owner_label(m.owner),
             fmt::join(m.dependencies, ", "));
  if (!report.persisted) {
    fmt::print("Store '{}' did not accept the change; nothing saved\n",
               session.store->name());
  }
}

}  // namespace

auto cmd_add(const CommonOptions& common, const EditOptions& opts) -> int {
  auto edit = parse_edit(opts);
  if (!edit) {
    return 1;
  }
  auto session = open_session(common);
  if (!session) {
    fmt::print(stderr, "Error: {}\n", session.error().message());
    return 1;
  }

  auto result = session->service->add(edit->owner, edit->target);
  if (!result) {
    fmt::print(stderr, "Error: cannot add {} -> {}: {}\n", edit->owner,
               edit->target, result.error().message());
    return 1;
  }
  report_mutation(*session, *result);
  return 0;
}

auto cmd_remove(const CommonOptions& common, const EditOptions& opts) -> int {
  auto edit = parse_edit(opts);
  if (!edit) {
    return 1;
  }
  auto session = open_session(common);
  if (!session) {
    fmt::print(stderr, "Error: {}\n", session.error().message());
    return 1;
  }

  auto result = session->service->remove(edit->owner, edit->target);
  if (!result) {
    fmt::print(stderr, "Error: cannot remove {} -> {}: {}\n", edit->owner,
               edit->target, result.error().message());
    return 1;
  }
  report_mutation(*session, *result);
  return 0;
}

}  // namespace workgraph::cli
