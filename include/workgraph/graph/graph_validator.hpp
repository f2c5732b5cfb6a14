#pragma once

#include "workgraph/graph/reference.hpp"
#include "workgraph/graph/work_item.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace workgraph {

enum class IssueKind : std::uint8_t {
  Self,
  Missing,
  Circular,
  Duplicate,
};

[[nodiscard]] constexpr auto issue_kind_name(IssueKind kind) noexcept
    -> std::string_view {
  switch (kind) {
    case IssueKind::Self: return "self";
    case IssueKind::Missing: return "missing";
    case IssueKind::Circular: return "circular";
    case IssueKind::Duplicate: return "duplicate";
  }
  return "unknown";
}

struct Issue {
  IssueKind kind{IssueKind::Missing};
  Reference owner;
  std::optional<Reference> dependency;
  std::string message;
};

struct GraphSummary {
  std::size_t items{0};
  std::size_t subitems{0};
  std::size_t dependencies{0};
};

// "Task 5" or "Subtask 5.2".
[[nodiscard]] auto owner_label(const Reference& ref) -> std::string;

[[nodiscard]] auto exists(const Snapshot& snapshot, const Reference& ref)
    -> bool;

[[nodiscard]] auto is_self_dependency(const Reference& owner,
                                      const Reference& ref) -> bool;

// Walks dependency edges depth-first from `start`. Returns true once the walk
// reaches an id already on the current chain; `extra_chain` pre-seeds that
// chain, so detect_cycle(s, target, {owner}) asks whether owner -> target
// would close a cycle. Missing targets end a branch. Self edges are not
// followed.
[[nodiscard]] auto detect_cycle(const Snapshot& snapshot,
                                const Reference& start,
                                std::span<const Reference> extra_chain = {})
    -> bool;

// True when `node` can reach itself through one or more dependency edges
// other than a self edge.
[[nodiscard]] auto is_on_cycle(const Snapshot& snapshot, const Reference& node)
    -> bool;

// One issue per offending (owner, reference) pair, one missing issue per
// malformed entry, plus one circular issue per owner, in item-then-subtask
// order. An id that occurs more than once yields a duplicate issue for each
// repeat.
[[nodiscard]] auto validate_all(const Snapshot& snapshot)
    -> std::vector<Issue>;

[[nodiscard]] auto summarize(const Snapshot& snapshot) -> GraphSummary;

}  // namespace workgraph
