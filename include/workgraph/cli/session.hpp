#pragma once

#include "workgraph/app/dependency_service.hpp"
#include "workgraph/cli/commands.hpp"
#include "workgraph/config/system_config.hpp"
#include "workgraph/core/error.hpp"
#include "workgraph/storage/task_store.hpp"

#include <memory>
#include <string_view>

namespace workgraph::cli {

inline constexpr std::string_view kDefaultConfigFile = "workgraph.yaml";

struct Session {
  SystemConfig config;
  std::unique_ptr<ITaskStore> store;
  std::unique_ptr<DependencyService> service;
};

// Loads the config file (the explicit one, or workgraph.yaml when present),
// applies command line overrides, sets the log level and opens the store.
[[nodiscard]] auto resolve_config(const CommonOptions& common)
    -> Result<SystemConfig>;
[[nodiscard]] auto open_session(const CommonOptions& common) -> Result<Session>;

}  // namespace workgraph::cli
