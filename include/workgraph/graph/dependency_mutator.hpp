#pragma once

#include "workgraph/core/error.hpp"
#include "workgraph/graph/reference.hpp"
#include "workgraph/graph/work_item.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace workgraph {

enum class MutationOutcome : std::uint8_t {
  Applied,
  AlreadyPresent,
  NotPresent,
};

[[nodiscard]] constexpr auto mutation_outcome_name(MutationOutcome outcome)
    noexcept -> std::string_view {
  switch (outcome) {
    case MutationOutcome::Applied: return "applied";
    case MutationOutcome::AlreadyPresent: return "already present";
    case MutationOutcome::NotPresent: return "not present";
  }
  return "unknown";
}

// New dependency list of one owner. Nothing is written anywhere until the
// caller applies or persists it.
struct Mutation {
  Reference owner;
  Reference target;
  std::vector<Reference> dependencies;
  MutationOutcome outcome{MutationOutcome::Applied};

  [[nodiscard]] auto changed() const noexcept -> bool {
    return outcome == MutationOutcome::Applied;
  }
};

// Fails with NotFound, SelfDependency or CircularDependency. A target that is
// already listed yields outcome AlreadyPresent and the list unchanged.
[[nodiscard]] auto add_dependency(const Snapshot& snapshot,
                                  const Reference& owner,
                                  const Reference& target)
    -> Result<Mutation>;

// Fails only with NotFound for a missing owner. Removing an absent target is a
// no-op with outcome NotPresent.
[[nodiscard]] auto remove_dependency(const Snapshot& snapshot,
                                     const Reference& owner,
                                     const Reference& target)
    -> Result<Mutation>;

// Bare task references ascending, then subtask references by (parent, sub).
auto sort_dependencies(std::vector<Reference>& deps) -> void;

// Writes the mutation's list into `snapshot`.
[[nodiscard]] auto apply(Snapshot& snapshot, const Mutation& mutation)
    -> Result<void>;

}  // namespace workgraph
