#include "workgraph/graph/auto_fixer.hpp"

#include "workgraph/graph/graph_validator.hpp"
#include "workgraph/util/log.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace workgraph {

namespace {

using SubitemGraph =
    std::unordered_map<Reference, std::vector<Reference>>;

// Whether `target` is reachable from `from` over subitem edges only.
auto reaches(const SubitemGraph& graph, const Reference& from,
             const Reference& target) -> bool {
  std::unordered_set<Reference> visited;
  std::vector<Reference> stack{from};

  while (!stack.empty()) {
    Reference current = stack.back();
    stack.pop_back();
    if (current == target) {
      return true;
    }
    if (!visited.insert(current).second) {
      continue;
    }
    auto it = graph.find(current);
    if (it == graph.end()) {
      continue;
    }
    for (const auto& dep : it->second) {
      if (!visited.contains(dep)) {
        stack.push_back(dep);
      }
    }
  }
  return false;
}

}  // namespace

auto remove_duplicate_dependencies(Snapshot& snapshot, FixStats& stats)
    -> void {
  snapshot.for_each_owner([&](const Reference& owner,
                              std::vector<Reference>& deps) {
    std::unordered_set<Reference> seen;
    auto removed = std::erase_if(deps, [&](const Reference& dep) {
      if (seen.insert(dep).second) {
        return false;
      }
      log::debug("Removing duplicate dependency from {}: {}",
                 owner_label(owner), dep);
      return true;
    });
    stats.duplicates_removed += removed;
  });
}

auto remove_missing_dependencies(Snapshot& snapshot, FixStats& stats)
    -> void {
  snapshot.rebuild_index();
  const Snapshot& lookup = snapshot;

  snapshot.for_each_owner([&](const Reference& owner,
                              std::vector<Reference>& deps) {
    auto removed = std::erase_if(deps, [&](const Reference& dep) {
      if (exists(lookup, dep)) {
        return false;
      }
      log::debug("Removing invalid dependency from {}: {} does not exist",
                 owner_label(owner), dep);
      return true;
    });
    stats.missing_removed += removed;
  });

  auto drop_malformed = [&stats](const Reference& owner,
                                 std::vector<std::string>& malformed) {
    for (const auto& entry : malformed) {
      log::debug("Removing malformed dependency from {}: {}",
                 owner_label(owner), entry);
    }
    stats.missing_removed += malformed.size();
    malformed.clear();
  };
  for (auto& item : snapshot.items) {
    drop_malformed(item.ref(), item.malformed_dependencies);
    for (auto& sub : item.subtasks) {
      drop_malformed(sub.ref(), sub.malformed_dependencies);
    }
  }
}

auto remove_self_dependencies(Snapshot& snapshot, FixStats& stats) -> void {
  snapshot.for_each_owner([&](const Reference& owner,
                              std::vector<Reference>& deps) {
    auto removed = std::erase_if(deps, [&](const Reference& dep) {
      return is_self_dependency(owner, dep);
    });
    if (removed > 0) {
      log::debug("Removing self-dependency from {}", owner_label(owner));
    }
    stats.self_removed += removed;
  });
}

auto break_subitem_cycles(Snapshot& snapshot, FixStats& stats) -> void {
  SubitemGraph graph;
  std::vector<Reference> order;
  for (const auto& item : snapshot.items) {
    for (const auto& sub : item.subtasks) {
      graph[sub.ref()] = sub.dependencies;
      order.push_back(sub.ref());
    }
  }

  for (const auto& node : order) {
    auto& edges = graph[node];

    // An edge node -> dep closes a cycle when dep leads back to node.
    std::vector<Reference> closing;
    for (const auto& dep : edges) {
      if (dep.is_subtask() && graph.contains(dep) && reaches(graph, dep, node)) {
        closing.push_back(dep);
      }
    }
    if (closing.empty()) {
      continue;
    }

    auto* deps = snapshot.mutable_dependencies(node);
    for (const auto& dep : closing) {
      log::debug("Breaking circular dependency: removing {} from {}", dep,
                 owner_label(node));
      std::erase(edges, dep);
      if (deps != nullptr) {
        std::erase(*deps, dep);
      }
      ++stats.cycles_broken;
    }
  }
}

auto ensure_independent_subitem(Snapshot& snapshot, FixStats& stats) -> void {
  for (auto& item : snapshot.items) {
    if (item.subtasks.empty()) {
      continue;
    }
    bool has_independent = std::ranges::any_of(
        item.subtasks, [](const Subitem& s) { return s.dependencies.empty(); });
    if (has_independent) {
      continue;
    }
    auto& first = item.subtasks.front();
    log::debug("Clearing dependencies of {} so task {} is not blocked "
               "internally",
               owner_label(first.ref()), item.id);
    first.dependencies.clear();
    ++stats.usability_resets;
  }
}

auto diff_dependencies(const Snapshot& before, const Snapshot& after)
    -> std::vector<DependencyChange> {
  std::vector<DependencyChange> changes;
  std::unordered_set<Reference> seen;
  after.for_each_owner([&](const Reference& owner,
                           const std::vector<Reference>& deps) {
    // Only the indexed copy of a duplicated id is addressable by a store.
    if (!seen.insert(owner).second) {
      return;
    }
    const auto* original = before.dependencies_of(owner);
    const auto* original_malformed = before.malformed_of(owner);
    const auto* malformed = after.malformed_of(owner);
    if (original == nullptr || *original != deps ||
        (original_malformed && malformed &&
         *original_malformed != *malformed)) {
      changes.push_back(DependencyChange{owner, deps});
    }
  });
  return changes;
}

auto fix_dependencies(const Snapshot& snapshot) -> FixReport {
  FixReport report;
  report.fixed = snapshot;
  auto& working = report.fixed;
  working.rebuild_index();

  remove_duplicate_dependencies(working, report.stats);
  remove_missing_dependencies(working, report.stats);
  remove_self_dependencies(working, report.stats);
  break_subitem_cycles(working, report.stats);
  ensure_independent_subitem(working, report.stats);

  working.for_each_owner([&](const Reference& owner,
                             const std::vector<Reference>&) {
    if (is_on_cycle(working, owner)) {
      report.unresolved_cycles.push_back(owner);
    }
  });
  if (!report.unresolved_cycles.empty()) {
    log::warn("{} item(s) remain on a dependency cycle that is not repaired "
              "automatically",
              report.unresolved_cycles.size());
  }

  report.changes = diff_dependencies(snapshot, working);
  for (const auto& change : report.changes) {
    if (change.owner.is_subtask()) {
      ++report.stats.subitems_fixed;
    } else {
      ++report.stats.items_fixed;
    }
  }
  return report;
}

}  // namespace workgraph
