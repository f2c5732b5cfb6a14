#pragma once

#include "workgraph/graph/work_item.hpp"

#include <algorithm>
#include <array>
#include <iterator>
#include <string_view>
#include <utility>

namespace workgraph {

namespace detail {

constexpr std::array<std::string_view, 8> kItemStatusNames = {
    "pending",
    "in-progress",
    "review",
    "done",
    "completed",
    "blocked",
    "deferred",
    "cancelled",
};

constexpr std::array<std::string_view, 3> kPriorityNames = {
    "low",
    "medium",
    "high",
};

}  // namespace detail

[[nodiscard]] inline auto item_status_name(ItemStatus status) noexcept
    -> std::string_view {
  auto idx = std::to_underlying(status);
  return idx < detail::kItemStatusNames.size() ? detail::kItemStatusNames[idx]
                                               : "pending";
}

[[nodiscard]] inline auto parse_item_status(std::string_view name) noexcept
    -> ItemStatus {
  auto it = std::ranges::find(detail::kItemStatusNames, name);
  if (it != detail::kItemStatusNames.end()) {
    return static_cast<ItemStatus>(
        std::distance(detail::kItemStatusNames.begin(), it));
  }
  return ItemStatus::Pending;
}

[[nodiscard]] inline auto priority_name(Priority priority) noexcept
    -> std::string_view {
  auto idx = std::to_underlying(priority);
  return idx < detail::kPriorityNames.size() ? detail::kPriorityNames[idx]
                                             : "medium";
}

[[nodiscard]] inline auto parse_priority(std::string_view name) noexcept
    -> Priority {
  auto it = std::ranges::find(detail::kPriorityNames, name);
  if (it != detail::kPriorityNames.end()) {
    return static_cast<Priority>(
        std::distance(detail::kPriorityNames.begin(), it));
  }
  return Priority::Medium;
}

}  // namespace workgraph
