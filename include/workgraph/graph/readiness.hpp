#pragma once

#include "workgraph/graph/work_item.hpp"

#include <optional>
#include <vector>

namespace workgraph {

// Whether every dependency of `deps` names a done or completed item or
// subitem. A missing target is never complete.
[[nodiscard]] auto dependencies_satisfied(const Snapshot& snapshot,
                                          const std::vector<Reference>& deps)
    -> bool;

// Pending or in-progress items whose dependencies are all complete and that
// carry no malformed dependency entry, ordered by priority (high first), then
// fewer dependencies, then lower id.
[[nodiscard]] auto ready_items(const Snapshot& snapshot) -> std::vector<Item>;

[[nodiscard]] auto find_next(const Snapshot& snapshot) -> std::optional<Item>;

}  // namespace workgraph
