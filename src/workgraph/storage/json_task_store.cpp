#include "workgraph/storage/json_task_store.hpp"

#include "workgraph/storage/json_codec.hpp"
#include "workgraph/util/log.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace workgraph {

namespace {

auto find_by_id(nlohmann::json& array, ItemId id) -> nlohmann::json* {
  if (!array.is_array()) {
    return nullptr;
  }
  for (auto& node : array) {
    if (decode_id(node) == id) {
      return &node;
    }
  }
  return nullptr;
}

// Locates the JSON object holding `ref` inside the tasks array.
auto find_owner(nlohmann::json& tasks, const Reference& ref)
    -> nlohmann::json* {
  auto* item = find_by_id(tasks, ref.item_id());
  if (!item || ref.is_task()) {
    return item;
  }
  auto subs = item->find("subtasks");
  if (subs == item->end()) {
    return nullptr;
  }
  return find_by_id(*subs, *ref.sub_id());
}

auto context_of(const Reference& ref) -> std::optional<ItemId> {
  if (ref.is_subtask()) {
    return ref.item_id();
  }
  return std::nullopt;
}

}  // namespace

JsonTaskStore::JsonTaskStore(std::string_view path, std::string_view tag)
    : path_(path), tag_(tag) {
}

auto JsonTaskStore::load_document() -> Result<nlohmann::json> {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    log::error("Tasks file not found: {}", path_);
    return fail(Error::FileNotFound);
  }

  std::ifstream file(path_);
  if (!file.is_open()) {
    log::error("Failed to open tasks file: {}", path_);
    return fail(Error::FileOpenFailed);
  }

  try {
    return nlohmann::json::parse(file);
  } catch (const nlohmann::json::parse_error& e) {
    log::error("Failed to parse {}: {}", path_, e.what());
    return fail(Error::ParseError);
  }
}

auto JsonTaskStore::save_document(const nlohmann::json& doc) -> Result<void> {
  auto tmp_path = path_ + ".tmp";
  {
    std::ofstream file(tmp_path, std::ios::trunc);
    if (!file.is_open()) {
      log::error("Failed to open file for writing: {}", tmp_path);
      return fail(Error::FileOpenFailed);
    }
    file << doc.dump(2) << '\n';
    if (!file.good()) {
      log::error("Failed to write {}", tmp_path);
      return fail(Error::FileOpenFailed);
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path_, ec);
  if (ec) {
    log::error("Failed to replace {}: {}", path_, ec.message());
    std::filesystem::remove(tmp_path, ec);
    return fail(Error::FileOpenFailed);
  }
  return ok();
}

auto JsonTaskStore::tasks_array(nlohmann::json& doc) -> nlohmann::json* {
  nlohmann::json* root = &doc;
  if (!tag_.empty()) {
    if (!doc.is_object() || !doc.contains(tag_)) {
      log::error("Tag '{}' not found in {}", tag_, path_);
      return nullptr;
    }
    root = &doc[tag_];
  }
  if (!root->is_object()) {
    return nullptr;
  }
  auto it = root->find("tasks");
  if (it == root->end() || !it->is_array()) {
    return nullptr;
  }
  return &*it;
}

auto JsonTaskStore::fetch_all() -> Result<Snapshot> {
  auto doc = load_document();
  if (!doc) {
    return std::unexpected(doc.error());
  }

  auto* tasks = tasks_array(*doc);
  if (!tasks) {
    log::error("No tasks array in {}", path_);
    return fail(Error::ParseError);
  }

  std::vector<Item> items;
  items.reserve(tasks->size());
  for (const auto& node : *tasks) {
    auto item = decode_item(node);
    if (!item) {
      return std::unexpected(item.error());
    }
    items.push_back(std::move(*item));
  }

  log::debug("Loaded {} items from {}", items.size(), path_);
  return make_snapshot(std::move(items));
}

auto JsonTaskStore::apply_partial_update(const Reference& ref,
                                         const DependencyUpdate& update)
    -> Result<void> {
  if (!update.dependencies) {
    return ok();
  }

  auto doc = load_document();
  if (!doc) {
    return std::unexpected(doc.error());
  }
  auto* tasks = tasks_array(*doc);
  if (!tasks) {
    return fail(Error::ParseError);
  }

  auto* owner = find_owner(*tasks, ref);
  if (!owner) {
    log::error("{} not found in {}", ref, path_);
    return fail(Error::NotFound);
  }
  (*owner)["dependencies"] = encode_dependencies(
      *update.dependencies, context_of(ref), update.malformed);
  return save_document(*doc);
}

auto JsonTaskStore::bulk_rewrite(const Snapshot& snapshot) -> Result<void> {
  auto doc = load_document();
  if (!doc) {
    return std::unexpected(doc.error());
  }
  auto* tasks = tasks_array(*doc);
  if (!tasks) {
    return fail(Error::ParseError);
  }

  Result<void> status = ok();
  snapshot.for_each_owner(
      [&](const Reference& ref, const std::vector<Reference>& deps) {
        if (!status) {
          return;
        }
        auto* owner = find_owner(*tasks, ref);
        if (!owner) {
          log::error("{} not found in {}", ref, path_);
          status = fail(Error::NotFound);
          return;
        }
        const auto* malformed = snapshot.malformed_of(ref);
        (*owner)["dependencies"] = encode_dependencies(
            deps, context_of(ref),
            malformed ? *malformed : std::vector<std::string>{});
      });
  if (!status) {
    return status;
  }
  return save_document(*doc);
}

auto JsonTaskStore::regenerate_derived_artifacts() -> void {
  if (on_persisted_) {
    on_persisted_();
  }
}

}  // namespace workgraph
