#include "workgraph/graph/readiness.hpp"

#include <algorithm>

namespace workgraph {

auto dependencies_satisfied(const Snapshot& snapshot,
                            const std::vector<Reference>& deps) -> bool {
  return std::ranges::all_of(deps, [&](const Reference& dep) {
    auto status = snapshot.status_of(dep);
    return status && is_complete(*status);
  });
}

auto ready_items(const Snapshot& snapshot) -> std::vector<Item> {
  std::vector<const Item*> eligible;
  for (const auto& item : snapshot.items) {
    if (is_actionable(item.status) && item.malformed_dependencies.empty() &&
        dependencies_satisfied(snapshot, item.dependencies)) {
      eligible.push_back(&item);
    }
  }

  std::ranges::sort(eligible, [](const Item* a, const Item* b) {
    auto pa = priority_rank(a->priority);
    auto pb = priority_rank(b->priority);
    if (pa != pb) {
      return pa > pb;
    }
    if (a->dependencies.size() != b->dependencies.size()) {
      return a->dependencies.size() < b->dependencies.size();
    }
    return a->id < b->id;
  });

  std::vector<Item> result;
  result.reserve(eligible.size());
  for (const auto* item : eligible) {
    result.push_back(*item);
  }
  return result;
}

auto find_next(const Snapshot& snapshot) -> std::optional<Item> {
  auto ready = ready_items(snapshot);
  if (ready.empty()) {
    return std::nullopt;
  }
  return std::move(ready.front());
}

}  // namespace workgraph
