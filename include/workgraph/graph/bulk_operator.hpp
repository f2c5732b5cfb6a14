#pragma once

#include "workgraph/core/error.hpp"
#include "workgraph/graph/range_spec.hpp"
#include "workgraph/graph/reference.hpp"
#include "workgraph/graph/work_item.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <system_error>
#include <vector>

namespace workgraph {

enum class BulkKind : std::uint8_t {
  Add,
  Remove,
};

enum class PairOutcome : std::uint8_t {
  Applied,
  SkippedNoOp,
  Error,
};

[[nodiscard]] constexpr auto pair_outcome_name(PairOutcome outcome) noexcept
    -> std::string_view {
  switch (outcome) {
    case PairOutcome::Applied: return "applied";
    case PairOutcome::SkippedNoOp: return "skipped";
    case PairOutcome::Error: return "error";
  }
  return "unknown";
}

struct BulkRequest {
  std::string_view task_spec;
  std::string_view dependency_spec;
  BulkKind kind{BulkKind::Add};
  bool dry_run{false};
  std::size_t max_range_size{kDefaultMaxRangeSize};
};

struct BulkOperation {
  Reference task;
  Reference dependency;
  PairOutcome outcome{PairOutcome::Applied};
  std::error_code error;
};

struct BulkSummary {
  std::size_t valid_operations{0};
  std::size_t operations_performed{0};
  std::size_t errors{0};
};

struct BulkReport {
  BulkSummary summary;
  std::vector<BulkOperation> operations;
  // Final list of every owner with at least one applied pair, in order of
  // first change.
  std::vector<DependencyChange> changes;
  bool dry_run{false};
};

// Attempts every (task, dependency) pair of the cross product of both range
// specs, task-major. Each pair sees the effect of the pairs before it. A
// malformed spec fails the whole call; per-pair failures are recorded and
// never stop the batch. operations_performed is left at zero for the caller
// that persists the changes.
[[nodiscard]] auto apply_bulk(const Snapshot& snapshot,
                              const BulkRequest& request)
    -> Result<BulkReport>;

}  // namespace workgraph
