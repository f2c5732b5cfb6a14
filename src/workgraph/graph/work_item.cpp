#include "workgraph/graph/work_item.hpp"

#include "workgraph/util/log.hpp"

namespace workgraph {

auto Snapshot::rebuild_index() -> void {
  index_.clear();
  for (std::size_t i = 0; i < items.size(); ++i) {
    auto& item = items[i];
    if (!index_.try_emplace(item.ref(), Location{i, std::nullopt}).second) {
      log::warn("Duplicate task id {}; only the first entry is addressable",
                item.id);
    }
    for (std::size_t j = 0; j < item.subtasks.size(); ++j) {
      auto& sub = item.subtasks[j];
      sub.parent_id = item.id;
      if (!index_.try_emplace(sub.ref(), Location{i, j}).second) {
        log::warn("Duplicate subtask id {}; only the first entry is "
                  "addressable",
                  sub.ref());
      }
    }
  }
}

auto Snapshot::find_item(ItemId id) -> Item* {
  auto it = index_.find(Reference::task(id));
  return it != index_.end() ? &items[it->second.item] : nullptr;
}

auto Snapshot::find_item(ItemId id) const -> const Item* {
  auto it = index_.find(Reference::task(id));
  return it != index_.end() ? &items[it->second.item] : nullptr;
}

auto Snapshot::find_subitem(ItemId parent_id, ItemId sub_id) -> Subitem* {
  auto it = index_.find(Reference::subtask(parent_id, sub_id));
  if (it == index_.end()) {
    return nullptr;
  }
  return &items[it->second.item].subtasks[*it->second.sub];
}

auto Snapshot::find_subitem(ItemId parent_id, ItemId sub_id) const
    -> const Subitem* {
  auto it = index_.find(Reference::subtask(parent_id, sub_id));
  if (it == index_.end()) {
    return nullptr;
  }
  return &items[it->second.item].subtasks[*it->second.sub];
}

auto Snapshot::dependencies_of(const Reference& ref) const
    -> const std::vector<Reference>* {
  auto it = index_.find(ref);
  if (it == index_.end()) {
    return nullptr;
  }
  const auto& item = items[it->second.item];
  return it->second.sub ? &item.subtasks[*it->second.sub].dependencies
                        : &item.dependencies;
}

auto Snapshot::mutable_dependencies(const Reference& ref)
    -> std::vector<Reference>* {
  auto it = index_.find(ref);
  if (it == index_.end()) {
    return nullptr;
  }
  auto& item = items[it->second.item];
  return it->second.sub ? &item.subtasks[*it->second.sub].dependencies
                        : &item.dependencies;
}

auto Snapshot::malformed_of(const Reference& ref) const
    -> const std::vector<std::string>* {
  auto it = index_.find(ref);
  if (it == index_.end()) {
    return nullptr;
  }
  const auto& item = items[it->second.item];
  return it->second.sub
             ? &item.subtasks[*it->second.sub].malformed_dependencies
             : &item.malformed_dependencies;
}

auto Snapshot::mutable_malformed(const Reference& ref)
    -> std::vector<std::string>* {
  auto it = index_.find(ref);
  if (it == index_.end()) {
    return nullptr;
  }
  auto& item = items[it->second.item];
  return it->second.sub
             ? &item.subtasks[*it->second.sub].malformed_dependencies
             : &item.malformed_dependencies;
}

auto Snapshot::status_of(const Reference& ref) const
    -> std::optional<ItemStatus> {
  auto it = index_.find(ref);
  if (it == index_.end()) {
    return std::nullopt;
  }
  const auto& item = items[it->second.item];
  return it->second.sub ? item.subtasks[*it->second.sub].status : item.status;
}

auto Snapshot::subitem_count() const noexcept -> std::size_t {
  std::size_t count = 0;
  for (const auto& item : items) {
    count += item.subtasks.size();
  }
  return count;
}

auto Snapshot::dependency_count() const noexcept -> std::size_t {
  std::size_t count = 0;
  for_each_owner([&count](const Reference&, const auto& deps) {
    count += deps.size();
  });
  return count;
}

auto make_snapshot(std::vector<Item> items) -> Snapshot {
  Snapshot snapshot;
  snapshot.items = std::move(items);
  snapshot.rebuild_index();
  return snapshot;
}

}  // namespace workgraph
