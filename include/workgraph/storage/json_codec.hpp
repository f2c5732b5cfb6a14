#pragma once

#include "workgraph/core/error.hpp"
#include "workgraph/graph/reference.hpp"
#include "workgraph/graph/work_item.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace workgraph {

struct DecodedDependencies {
  std::vector<Reference> references;
  // Entries that name no item, as compact JSON text.
  std::vector<std::string> malformed;
};

// tasks.json encoding of a dependency list. Inside a subitem's list
// (`context_parent` set) a sibling is a bare integer, any other subitem is
// "P.S", and a task is an integer when >= 100 or a decimal string otherwise,
// so it is not read back as a sibling. `malformed` entries are appended as
// they were read.
[[nodiscard]] auto encode_dependencies(
    const std::vector<Reference>& deps, std::optional<ItemId> context_parent,
    const std::vector<std::string>& malformed = {}) -> nlohmann::json;

[[nodiscard]] auto decode_dependencies(const nlohmann::json& deps,
                                       std::optional<ItemId> context_parent)
    -> DecodedDependencies;

// Canonical strings ("7", "7.2"), as stored in database columns, followed by
// the `malformed` entries.
[[nodiscard]] auto encode_canonical(
    const std::vector<Reference>& deps,
    const std::vector<std::string>& malformed = {}) -> nlohmann::json;

// Reverse of encode_canonical. No sibling context applies.
[[nodiscard]] auto decode_canonical(const nlohmann::json& deps)
    -> DecodedDependencies;

// Reads the "id" field of a task or subtask object.
[[nodiscard]] auto decode_id(const nlohmann::json& node)
    -> std::optional<ItemId>;

[[nodiscard]] auto decode_item(const nlohmann::json& node) -> Result<Item>;

}  // namespace workgraph
