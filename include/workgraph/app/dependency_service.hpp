#pragma once

#include "workgraph/core/error.hpp"
#include "workgraph/graph/auto_fixer.hpp"
#include "workgraph/graph/bulk_operator.hpp"
#include "workgraph/graph/dependency_mutator.hpp"
#include "workgraph/graph/graph_validator.hpp"
#include "workgraph/storage/task_store.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace workgraph {

struct ServiceOptions {
  std::size_t max_range_size{kDefaultMaxRangeSize};
};

struct ValidationReport {
  GraphSummary summary;
  std::vector<Issue> issues;

  [[nodiscard]] auto valid() const noexcept -> bool {
    return issues.empty();
  }
};

struct MutationReport {
  Mutation mutation;
  bool persisted{false};
};

struct FixResult {
  FixReport report;
  bool persisted{false};
};

// Runs the graph core against the snapshot of one task store and writes back
// only the owners whose lists changed. A store that answers Unsupported is
// logged and skipped; the computed report is still returned.
class DependencyService {
public:
  explicit DependencyService(ITaskStore& store, ServiceOptions options = {});

  [[nodiscard]] auto validate() -> Result<ValidationReport>;

  [[nodiscard]] auto add(const Reference& owner, const Reference& target)
      -> Result<MutationReport>;
  [[nodiscard]] auto remove(const Reference& owner, const Reference& target)
      -> Result<MutationReport>;

  [[nodiscard]] auto add_range(std::string_view task_spec,
                               std::string_view dependency_spec, bool dry_run)
      -> Result<BulkReport>;
  [[nodiscard]] auto remove_range(std::string_view task_spec,
                                  std::string_view dependency_spec,
                                  bool dry_run) -> Result<BulkReport>;

  [[nodiscard]] auto fix() -> Result<FixResult>;

  [[nodiscard]] auto next() -> Result<std::optional<Item>>;

private:
  [[nodiscard]] auto run_bulk(std::string_view task_spec,
                              std::string_view dependency_spec, BulkKind kind,
                              bool dry_run) -> Result<BulkReport>;

  // Returns whether anything was written.
  [[nodiscard]] auto persist(const Snapshot& updated,
                             const std::vector<DependencyChange>& changes)
      -> Result<bool>;

  ITaskStore& store_;
  ServiceOptions options_;
};

}  // namespace workgraph
