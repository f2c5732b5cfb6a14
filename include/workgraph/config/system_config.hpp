#pragma once

#include "workgraph/graph/range_spec.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace workgraph {

enum class StoreBackend { Json, Sqlite };

[[nodiscard]] constexpr auto store_backend_to_string(StoreBackend backend) noexcept
    -> std::string_view {
  switch (backend) {
    case StoreBackend::Json: return "json";
    case StoreBackend::Sqlite: return "sqlite";
  }
  return "json";
}

[[nodiscard]] constexpr auto string_to_store_backend(std::string_view str) noexcept
    -> std::optional<StoreBackend> {
  if (str == "json") return StoreBackend::Json;
  if (str == "sqlite") return StoreBackend::Sqlite;
  return std::nullopt;
}

struct StoreConfig {
  StoreBackend backend{StoreBackend::Json};
  std::string path{"tasks/tasks.json"};
  // Empty means the top-level "tasks" array of a JSON store.
  std::string tag;
};

struct LogConfig {
  std::string level{"info"};
  bool color{true};
};

struct BulkConfig {
  std::size_t max_range_size{kDefaultMaxRangeSize};
};

struct SystemConfig {
  StoreConfig store;
  LogConfig log;
  BulkConfig bulk;
};

}  // namespace workgraph
