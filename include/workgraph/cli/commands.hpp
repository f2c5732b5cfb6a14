#pragma once

#include "workgraph/config/system_config.hpp"

#include <optional>
#include <string>

namespace workgraph::cli {

// Settings shared by every command. Empty fields fall back to the config
// file, then to built-in defaults.
struct CommonOptions {
  std::string config_file;
  std::optional<StoreBackend> backend;
  std::string store_path;
  std::string log_level;
};

struct EditOptions {
  std::string owner;
  std::string target;
};

struct RangeOptions {
  std::string tasks;
  std::string dependencies;
  bool dry_run{false};
};

[[nodiscard]] auto cmd_validate(const CommonOptions& common) -> int;
[[nodiscard]] auto cmd_fix(const CommonOptions& common) -> int;
[[nodiscard]] auto cmd_add(const CommonOptions& common,
                           const EditOptions& opts) -> int;
[[nodiscard]] auto cmd_remove(const CommonOptions& common,
                              const EditOptions& opts) -> int;
[[nodiscard]] auto cmd_add_range(const CommonOptions& common,
                                 const RangeOptions& opts) -> int;
[[nodiscard]] auto cmd_remove_range(const CommonOptions& common,
                                    const RangeOptions& opts) -> int;
[[nodiscard]] auto cmd_next(const CommonOptions& common) -> int;

}  // namespace workgraph::cli
