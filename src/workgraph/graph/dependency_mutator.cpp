#include "workgraph/graph/dependency_mutator.hpp"

#include "workgraph/graph/graph_validator.hpp"
#include "workgraph/util/log.hpp"

#include <algorithm>
#include <array>

namespace workgraph {

auto sort_dependencies(std::vector<Reference>& deps) -> void {
  std::ranges::stable_sort(deps);
}

auto add_dependency(const Snapshot& snapshot, const Reference& owner,
                    const Reference& target) -> Result<Mutation> {
  const auto* deps = snapshot.dependencies_of(owner);
  if (deps == nullptr) {
    log::debug("Owner {} not found", owner);
    return fail(Error::NotFound);
  }

  if (!exists(snapshot, target)) {
    log::debug("Dependency target {} does not exist", target);
    return fail(Error::NotFound);
  }

  Mutation mutation{owner, target, *deps, MutationOutcome::Applied};

  if (std::ranges::find(*deps, target) != deps->end()) {
    mutation.outcome = MutationOutcome::AlreadyPresent;
    return ok(std::move(mutation));
  }

  if (is_self_dependency(owner, target)) {
    return fail(Error::SelfDependency);
  }

  std::array<Reference, 1> chain{owner};
  if (detect_cycle(snapshot, target, chain)) {
    return fail(Error::CircularDependency);
  }

  mutation.dependencies.push_back(target);
  sort_dependencies(mutation.dependencies);
  return ok(std::move(mutation));
}

auto remove_dependency(const Snapshot& snapshot, const Reference& owner,
                       const Reference& target) -> Result<Mutation> {
  const auto* deps = snapshot.dependencies_of(owner);
  if (deps == nullptr) {
    log::debug("Owner {} not found", owner);
    return fail(Error::NotFound);
  }

  Mutation mutation{owner, target, *deps, MutationOutcome::NotPresent};

  auto it = std::ranges::find(mutation.dependencies, target);
  if (it != mutation.dependencies.end()) {
    mutation.dependencies.erase(it);
    mutation.outcome = MutationOutcome::Applied;
  }
  return ok(std::move(mutation));
}

auto apply(Snapshot& snapshot, const Mutation& mutation) -> Result<void> {
  auto* deps = snapshot.mutable_dependencies(mutation.owner);
  if (deps == nullptr) {
    return fail(Error::NotFound);
  }
  *deps = mutation.dependencies;
  return ok();
}

}  // namespace workgraph
