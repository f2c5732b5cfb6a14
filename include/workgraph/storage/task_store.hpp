#pragma once

#include "workgraph/core/error.hpp"
#include "workgraph/graph/reference.hpp"
#include "workgraph/graph/work_item.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace workgraph {

struct StoreConfig;

// Fields of one item or subitem to overwrite. Fields left empty are kept.
// When `dependencies` is set the stored list becomes those references
// followed by the `malformed` entries, written back verbatim.
struct DependencyUpdate {
  std::optional<std::vector<Reference>> dependencies;
  std::vector<std::string> malformed;
};

// Backing store of work items. Implementations that cannot perform a
// persistence shape return Error::Unsupported; callers treat that as a
// warning, not a failure. Concurrent writers are not coordinated: the last
// write of a dependency list wins.
class ITaskStore {
public:
  virtual ~ITaskStore() = default;

  [[nodiscard]] virtual auto fetch_all() -> Result<Snapshot> = 0;

  [[nodiscard]] virtual auto apply_partial_update(const Reference& ref,
                                                  const DependencyUpdate& update)
      -> Result<void> = 0;

  // Rewrites the dependency list of every item and subitem in `snapshot`.
  [[nodiscard]] virtual auto bulk_rewrite(const Snapshot& snapshot)
      -> Result<void> = 0;

  // Invoked after every successful persistence.
  virtual auto regenerate_derived_artifacts() -> void = 0;

  [[nodiscard]] virtual auto name() const noexcept -> std::string_view = 0;
};

[[nodiscard]] auto open_task_store(const StoreConfig& config)
    -> Result<std::unique_ptr<ITaskStore>>;

}  // namespace workgraph
