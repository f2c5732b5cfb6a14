#include "workgraph/storage/task_store.hpp"

#include "workgraph/config/system_config.hpp"
#include "workgraph/storage/json_task_store.hpp"
#include "workgraph/storage/sqlite_task_store.hpp"
#include "workgraph/util/log.hpp"

namespace workgraph {

auto open_task_store(const StoreConfig& config)
    -> Result<std::unique_ptr<ITaskStore>> {
  switch (config.backend) {
    case StoreBackend::Json:
      return std::make_unique<JsonTaskStore>(config.path, config.tag);
    case StoreBackend::Sqlite: {
      auto store = std::make_unique<SqliteTaskStore>(config.path);
      if (auto r = store->open(); !r) {
        return std::unexpected(r.error());
      }
      return std::unique_ptr<ITaskStore>(std::move(store));
    }
  }
  log::error("Unsupported store backend");
  return fail(Error::InvalidArgument);
}

}  // namespace workgraph
