#pragma once

#include "workgraph/graph/reference.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace workgraph {

enum class ItemStatus : std::uint8_t {
  Pending,
  InProgress,
  Review,
  Done,
  Completed,
  Blocked,
  Deferred,
  Cancelled,
};

enum class Priority : std::uint8_t {
  Low,
  Medium,
  High,
};

[[nodiscard]] constexpr auto is_complete(ItemStatus status) noexcept -> bool {
  return status == ItemStatus::Done || status == ItemStatus::Completed;
}

[[nodiscard]] constexpr auto is_actionable(ItemStatus status) noexcept
    -> bool {
  return status == ItemStatus::Pending || status == ItemStatus::InProgress;
}

[[nodiscard]] constexpr auto priority_rank(Priority priority) noexcept -> int {
  switch (priority) {
    case Priority::High: return 3;
    case Priority::Medium: return 2;
    case Priority::Low: return 1;
  }
  return 2;
}

struct Subitem {
  ItemId parent_id{0};
  ItemId id{0};
  std::string title;
  ItemStatus status{ItemStatus::Pending};
  Priority priority{Priority::Medium};
  std::vector<Reference> dependencies;
  // Stored entries that name no item ("abc", 0, null), as JSON text.
  std::vector<std::string> malformed_dependencies;

  [[nodiscard]] auto ref() const -> Reference {
    return Reference::subtask(parent_id, id);
  }
};

struct Item {
  ItemId id{0};
  std::string title;
  ItemStatus status{ItemStatus::Pending};
  Priority priority{Priority::Medium};
  std::vector<Reference> dependencies;
  std::vector<std::string> malformed_dependencies;
  std::vector<Subitem> subtasks;

  [[nodiscard]] auto ref() const -> Reference {
    return Reference::task(id);
  }
};

// Full set of items as fetched from a task store. The index maps every
// canonical id to its position; call rebuild_index() after adding or removing
// items or subitems. Editing dependency lists does not invalidate it. When an
// id occurs twice the first occurrence is indexed.
struct Snapshot {
  std::vector<Item> items;

  auto rebuild_index() -> void;

  [[nodiscard]] auto contains(const Reference& ref) const -> bool {
    return index_.contains(ref);
  }

  [[nodiscard]] auto find_item(ItemId id) -> Item*;
  [[nodiscard]] auto find_item(ItemId id) const -> const Item*;
  [[nodiscard]] auto find_subitem(ItemId parent_id, ItemId sub_id)
      -> Subitem*;
  [[nodiscard]] auto find_subitem(ItemId parent_id, ItemId sub_id) const
      -> const Subitem*;

  [[nodiscard]] auto dependencies_of(const Reference& ref) const
      -> const std::vector<Reference>*;
  [[nodiscard]] auto mutable_dependencies(const Reference& ref)
      -> std::vector<Reference>*;
  [[nodiscard]] auto malformed_of(const Reference& ref) const
      -> const std::vector<std::string>*;
  [[nodiscard]] auto mutable_malformed(const Reference& ref)
      -> std::vector<std::string>*;
  [[nodiscard]] auto status_of(const Reference& ref) const
      -> std::optional<ItemStatus>;

  [[nodiscard]] auto item_count() const noexcept -> std::size_t {
    return items.size();
  }
  [[nodiscard]] auto subitem_count() const noexcept -> std::size_t;
  [[nodiscard]] auto dependency_count() const noexcept -> std::size_t;

  // Visits every item, then each of its subitems, in array order.
  template <typename Fn>
  auto for_each_owner(Fn&& fn) const -> void {
    for (const auto& item : items) {
      fn(item.ref(), item.dependencies);
      for (const auto& sub : item.subtasks) {
        fn(sub.ref(), sub.dependencies);
      }
    }
  }

  template <typename Fn>
  auto for_each_owner(Fn&& fn) -> void {
    for (auto& item : items) {
      fn(item.ref(), item.dependencies);
      for (auto& sub : item.subtasks) {
        fn(sub.ref(), sub.dependencies);
      }
    }
  }

private:
  struct Location {
    std::size_t item{0};
    std::optional<std::size_t> sub;
  };

  std::unordered_map<Reference, Location> index_;
};

// Replacement dependency list for one item or subitem.
struct DependencyChange {
  Reference owner;
  std::vector<Reference> dependencies;
};

[[nodiscard]] auto make_snapshot(std::vector<Item> items) -> Snapshot;

}  // namespace workgraph
