#include "workgraph/graph/graph_validator.hpp"

#include "workgraph/util/log.hpp"

#include <unordered_set>

namespace workgraph {

auto owner_label(const Reference& ref) -> std::string {
  return fmt::format("{} {}", ref.is_subtask() ? "Subtask" : "Task", ref);
}

auto exists(const Snapshot& snapshot, const Reference& ref) -> bool {
  return snapshot.contains(ref);
}

auto is_self_dependency(const Reference& owner, const Reference& ref)
    -> bool {
  return owner == ref;
}

auto detect_cycle(const Snapshot& snapshot, const Reference& start,
                  std::span<const Reference> extra_chain) -> bool {
  struct Frame {
    Reference node;
    const std::vector<Reference>* deps;
    std::size_t next;
  };

  std::unordered_set<Reference> chain(extra_chain.begin(), extra_chain.end());
  std::unordered_set<Reference> finished;
  std::vector<Frame> stack;

  // Returns true when `node` is already on the chain.
  auto enter = [&](const Reference& node) -> bool {
    if (chain.contains(node)) {
      return true;
    }
    if (finished.contains(node)) {
      return false;
    }
    const auto* deps = snapshot.dependencies_of(node);
    if (deps == nullptr) {
      finished.insert(node);
      return false;
    }
    chain.insert(node);
    stack.push_back(Frame{node, deps, 0});
    return false;
  };

  if (enter(start)) {
    return true;
  }

  while (!stack.empty()) {
    auto& frame = stack.back();
    if (frame.next < frame.deps->size()) {
      Reference dep = (*frame.deps)[frame.next++];
      if (dep == frame.node) {
        continue;
      }
      if (enter(dep)) {
        log::debug("Cycle detected from {} at {}", start, dep);
        return true;
      }
    } else {
      chain.erase(frame.node);
      finished.insert(frame.node);
      stack.pop_back();
    }
  }
  return false;
}

auto is_on_cycle(const Snapshot& snapshot, const Reference& node) -> bool {
  const auto* start = snapshot.dependencies_of(node);
  if (start == nullptr) {
    return false;
  }

  std::unordered_set<Reference> visited;
  std::vector<Reference> stack;
  for (const auto& dep : *start) {
    if (dep != node) {
      stack.push_back(dep);
    }
  }

  while (!stack.empty()) {
    Reference current = stack.back();
    stack.pop_back();
    if (current == node) {
      return true;
    }
    if (!visited.insert(current).second) {
      continue;
    }
    if (const auto* deps = snapshot.dependencies_of(current)) {
      for (const auto& dep : *deps) {
        if (!visited.contains(dep)) {
          stack.push_back(dep);
        }
      }
    }
  }
  return false;
}

auto validate_all(const Snapshot& snapshot) -> std::vector<Issue> {
  std::vector<Issue> issues;
  std::unordered_set<Reference> seen;

  snapshot.for_each_owner([&](const Reference& owner,
                              const std::vector<Reference>& deps) {
    if (!seen.insert(owner).second) {
      issues.push_back(Issue{IssueKind::Duplicate, owner, std::nullopt,
                             fmt::format("{} is defined more than once",
                                         owner_label(owner))});
      return;
    }

    for (const auto& dep : deps) {
      if (is_self_dependency(owner, dep)) {
        issues.push_back(Issue{IssueKind::Self, owner, dep,
                               fmt::format("{} depends on itself",
                                           owner_label(owner))});
        continue;
      }
      if (!exists(snapshot, dep)) {
        issues.push_back(Issue{
            IssueKind::Missing, owner, dep,
            fmt::format("{} depends on non-existent {} {}", owner_label(owner),
                        dep.is_subtask() ? "subtask" : "task", dep)});
      }
    }

    if (const auto* malformed = snapshot.malformed_of(owner)) {
      for (const auto& entry : *malformed) {
        issues.push_back(Issue{
            IssueKind::Missing, owner, std::nullopt,
            fmt::format("{} depends on malformed reference {}",
                        owner_label(owner), entry)});
      }
    }

    if (detect_cycle(snapshot, owner)) {
      issues.push_back(Issue{
          IssueKind::Circular, owner, std::nullopt,
          fmt::format("{} is part of a circular dependency chain",
                      owner_label(owner))});
    }
  });

  return issues;
}

auto summarize(const Snapshot& snapshot) -> GraphSummary {
  return GraphSummary{snapshot.item_count(), snapshot.subitem_count(),
                      snapshot.dependency_count()};
}

}  // namespace workgraph
