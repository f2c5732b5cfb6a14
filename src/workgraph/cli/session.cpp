#include "workgraph/cli/session.hpp"

#include "workgraph/config/config.hpp"
#include "workgraph/util/log.hpp"

#include <filesystem>

namespace workgraph::cli {

auto resolve_config(const CommonOptions& common) -> Result<SystemConfig> {
  SystemConfig config;

  std::string path = common.config_file;
  if (path.empty()) {
    std::error_code ec;
    if (std::filesystem::exists(kDefaultConfigFile, ec)) {
      path = kDefaultConfigFile;
    }
  }

  if (!path.empty()) {
    auto loaded = ConfigLoader::load_from_file(path);
    if (!loaded) {
      return std::unexpected(loaded.error());
    }
    config = std::move(*loaded);
  }

  if (common.backend) {
    config.store.backend = *common.backend;
  }
  if (!common.store_path.empty()) {
    config.store.path = common.store_path;
  }
  if (!common.log_level.empty()) {
    config.log.level = common.log_level;
  }
  return config;
}

auto open_session(const CommonOptions& common) -> Result<Session> {
  auto config = resolve_config(common);
  if (!config) {
    return std::unexpected(config.error());
  }

  log::set_level(config->log.level);
  log::logger().set_color(config->log.color);

  auto store = open_task_store(config->store);
  if (!store) {
    log::error("Failed to open {} store at {}: {}",
               store_backend_to_string(config->store.backend),
               config->store.path, store.error().message());
    return std::unexpected(store.error());
  }

  Session session{.config = std::move(*config), .store = std::move(*store)};
  session.service = std::make_unique<DependencyService>(
      *session.store,
      ServiceOptions{.max_range_size = session.config.bulk.max_range_size});
  return ok(std::move(session));
}

}  // namespace workgraph::cli
