#pragma once

#include "workgraph/config/system_config.hpp"
#include "workgraph/core/error.hpp"

#include <string>
#include <string_view>

namespace workgraph {

using Config = SystemConfig;

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;

  [[nodiscard]] static auto to_string(const SystemConfig& config)
      -> std::string;
};

}  // namespace workgraph
