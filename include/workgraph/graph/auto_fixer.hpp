#pragma once

#include "workgraph/graph/reference.hpp"
#include "workgraph/graph/work_item.hpp"

#include <cstddef>
#include <vector>

namespace workgraph {

struct FixStats {
  std::size_t duplicates_removed{0};
  std::size_t missing_removed{0};
  std::size_t self_removed{0};
  std::size_t cycles_broken{0};
  std::size_t usability_resets{0};
  std::size_t items_fixed{0};
  std::size_t subitems_fixed{0};

  [[nodiscard]] auto total_removed() const noexcept -> std::size_t {
    return duplicates_removed + missing_removed + self_removed + cycles_broken;
  }
};

struct FixReport {
  FixStats stats;
  // One entry per owner whose list differs from the input snapshot.
  std::vector<DependencyChange> changes;
  Snapshot fixed;
  // Owners still on a cycle after the pipeline. Cycles that pass through a
  // top-level item are reported here and left untouched.
  std::vector<Reference> unresolved_cycles;

  [[nodiscard]] auto changed() const noexcept -> bool {
    return !changes.empty();
  }
};

// Runs dedup, prune missing, prune self, break subitem cycles and the
// usability pass over a copy of `snapshot`. Never fails.
[[nodiscard]] auto fix_dependencies(const Snapshot& snapshot) -> FixReport;

// Individual phases, each in place. Exposed for the pipeline tests.
auto remove_duplicate_dependencies(Snapshot& snapshot, FixStats& stats)
    -> void;
auto remove_missing_dependencies(Snapshot& snapshot, FixStats& stats) -> void;
auto remove_self_dependencies(Snapshot& snapshot, FixStats& stats) -> void;
auto break_subitem_cycles(Snapshot& snapshot, FixStats& stats) -> void;
auto ensure_independent_subitem(Snapshot& snapshot, FixStats& stats) -> void;

// Owners whose dependency list, or set of malformed entries, differs between
// two snapshots of the same items.
[[nodiscard]] auto diff_dependencies(const Snapshot& before,
                                     const Snapshot& after)
    -> std::vector<DependencyChange>;

}  // namespace workgraph
