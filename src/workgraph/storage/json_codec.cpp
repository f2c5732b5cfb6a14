#include "workgraph/storage/json_codec.hpp"

#include "workgraph/storage/state_strings.hpp"
#include "workgraph/util/log.hpp"

#include <string>
#include <utility>

namespace workgraph {

namespace {

auto raw_reference(const nlohmann::json& node) -> std::optional<RawReference> {
  if (node.is_number_integer()) {
    return RawReference{node.get<std::int64_t>()};
  }
  if (node.is_string()) {
    return RawReference{node.get<std::string>()};
  }
  return std::nullopt;
}

template <typename T>
auto read_field(const nlohmann::json& node, const char* key, T default_val)
    -> T {
  auto it = node.find(key);
  if (it == node.end() || it->is_null()) {
    return default_val;
  }
  return it->template get<T>();
}

auto append_malformed(nlohmann::json& out,
                      const std::vector<std::string>& malformed) -> void {
  for (const auto& entry : malformed) {
    auto value = nlohmann::json::parse(entry, nullptr, false);
    if (value.is_discarded()) {
      log::warn("Dropping unreadable dependency entry {}", entry);
      continue;
    }
    out.push_back(std::move(value));
  }
}

}  // namespace

auto encode_dependencies(const std::vector<Reference>& deps,
                         std::optional<ItemId> context_parent,
                         const std::vector<std::string>& malformed)
    -> nlohmann::json {
  auto out = nlohmann::json::array();
  for (const auto& dep : deps) {
    if (dep.is_subtask()) {
      auto sub = *dep.sub_id();
      if (context_parent && dep.item_id() == *context_parent &&
          sub < kSiblingReferenceLimit) {
        out.push_back(sub);
      } else {
        out.push_back(dep.to_string());
      }
    } else if (context_parent && dep.item_id() < kSiblingReferenceLimit) {
      out.push_back(dep.to_string());
    } else {
      out.push_back(dep.item_id());
    }
  }
  append_malformed(out, malformed);
  return out;
}

auto decode_dependencies(const nlohmann::json& deps,
                         std::optional<ItemId> context_parent)
    -> DecodedDependencies {
  DecodedDependencies result;
  if (!deps.is_array()) {
    return result;
  }
  result.references.reserve(deps.size());
  for (const auto& entry : deps) {
    auto raw = raw_reference(entry);
    auto ref = raw ? normalize_reference(*raw, context_parent)
                   : Result<Reference>{fail(Error::InvalidArgument)};
    if (!ref) {
      log::debug("Malformed dependency entry {}", entry.dump());
      result.malformed.push_back(entry.dump());
      continue;
    }
    result.references.push_back(*ref);
  }
  return result;
}

auto encode_canonical(const std::vector<Reference>& deps,
                      const std::vector<std::string>& malformed)
    -> nlohmann::json {
  auto out = nlohmann::json::array();
  for (const auto& dep : deps) {
    out.push_back(dep.to_string());
  }
  append_malformed(out, malformed);
  return out;
}

auto decode_canonical(const nlohmann::json& deps) -> DecodedDependencies {
  DecodedDependencies result;
  if (!deps.is_array()) {
    return result;
  }
  for (const auto& entry : deps) {
    if (!entry.is_string()) {
      result.malformed.push_back(entry.dump());
      continue;
    }
    auto ref = parse_id(entry.get<std::string>());
    if (!ref) {
      result.malformed.push_back(entry.dump());
      continue;
    }
    result.references.push_back(*ref);
  }
  return result;
}

auto decode_id(const nlohmann::json& node) -> std::optional<ItemId> {
  if (!node.is_object()) {
    return std::nullopt;
  }
  auto it = node.find("id");
  if (it == node.end()) {
    return std::nullopt;
  }
  auto raw = raw_reference(*it);
  if (!raw) {
    return std::nullopt;
  }
  auto ref = normalize_reference(*raw, std::nullopt);
  if (!ref || !ref->is_task()) {
    return std::nullopt;
  }
  return ref->item_id();
}

auto decode_item(const nlohmann::json& node) -> Result<Item> {
  if (!node.is_object()) {
    return fail(Error::ParseError);
  }
  try {
    auto id = decode_id(node);
    if (!id) {
      log::error("Task entry without a valid id: {}", node.dump());
      return fail(Error::ParseError);
    }

    Item item;
    item.id = *id;
    item.title = read_field<std::string>(node, "title", "");
    item.status =
        parse_item_status(read_field<std::string>(node, "status", "pending"));
    item.priority =
        parse_priority(read_field<std::string>(node, "priority", "medium"));
    if (auto it = node.find("dependencies"); it != node.end()) {
      auto deps = decode_dependencies(*it, std::nullopt);
      item.dependencies = std::move(deps.references);
      item.malformed_dependencies = std::move(deps.malformed);
    }

    if (auto subs = node.find("subtasks");
        subs != node.end() && subs->is_array()) {
      for (const auto& sub_node : *subs) {
        auto sub_id = decode_id(sub_node);
        if (!sub_id) {
          log::error("Subtask of task {} without a valid id", item.id);
          return fail(Error::ParseError);
        }
        Subitem sub;
        sub.parent_id = item.id;
        sub.id = *sub_id;
        sub.title = read_field<std::string>(sub_node, "title", "");
        sub.status = parse_item_status(
            read_field<std::string>(sub_node, "status", "pending"));
        sub.priority = parse_priority(
            read_field<std::string>(sub_node, "priority", "medium"));
        if (auto it = sub_node.find("dependencies"); it != sub_node.end()) {
          auto deps = decode_dependencies(*it, item.id);
          sub.dependencies = std::move(deps.references);
          sub.malformed_dependencies = std::move(deps.malformed);
        }
        item.subtasks.push_back(std::move(sub));
      }
    }
    return ok(std::move(item));
  } catch (const nlohmann::json::exception& e) {
    log::error("Malformed task entry: {}", e.what());
    return fail(Error::ParseError);
  }
}

}  // namespace workgraph
