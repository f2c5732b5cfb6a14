#pragma once

#include "workgraph/graph/work_item.hpp"
#include "workgraph/storage/task_store.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gtest/gtest.h>
#include <unistd.h>

namespace workgraph::test {

[[nodiscard]] inline auto T(ItemId id) -> Reference {
  return Reference::task(id);
}

[[nodiscard]] inline auto S(ItemId parent_id, ItemId sub_id) -> Reference {
  return Reference::subtask(parent_id, sub_id);
}

[[nodiscard]] inline auto item(ItemId id, std::vector<Reference> deps = {},
                               ItemStatus status = ItemStatus::Pending,
                               Priority priority = Priority::Medium) -> Item {
  Item out;
  out.id = id;
  out.title = "Task " + std::to_string(id);
  out.status = status;
  out.priority = priority;
  out.dependencies = std::move(deps);
  return out;
}

[[nodiscard]] inline auto subitem(ItemId id, std::vector<Reference> deps = {},
                                  ItemStatus status = ItemStatus::Pending)
    -> Subitem {
  Subitem out;
  out.id = id;
  out.title = "Subtask " + std::to_string(id);
  out.status = status;
  out.dependencies = std::move(deps);
  return out;
}

[[nodiscard]] inline auto with_subtasks(Item parent, std::vector<Subitem> subs)
    -> Item {
  for (auto& sub : subs) {
    sub.parent_id = parent.id;
  }
  parent.subtasks = std::move(subs);
  return parent;
}

// Temp file path created with mkstemp; removed on destruction along with
// any sibling written by atomic replace.
class TempPath {
public:
  explicit TempPath(std::string_view suffix) {
    std::string tmp_pattern = "/tmp/workgraph_test_XXXXXX";
    int fd = ::mkstemp(tmp_pattern.data());
    EXPECT_GE(fd, 0) << "Failed to create temp file: " << std::strerror(errno);
    if (fd >= 0) {
      ::close(fd);
    }
    path_ = tmp_pattern + std::string(suffix);
    std::filesystem::rename(tmp_pattern, path_);
  }

  ~TempPath() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    std::filesystem::remove(path_ + ".tmp", ec);
    std::filesystem::remove(path_ + "-wal", ec);
    std::filesystem::remove(path_ + "-shm", ec);
  }

  TempPath(const TempPath&) = delete;
  TempPath& operator=(const TempPath&) = delete;

  [[nodiscard]] auto str() const -> const std::string& {
    return path_;
  }

  auto write(std::string_view content) const -> void {
    std::ofstream file(path_, std::ios::trunc);
    file << content;
  }

  [[nodiscard]] auto read() const -> std::string {
    std::ifstream file(path_);
    return {std::istreambuf_iterator<char>(file),
            std::istreambuf_iterator<char>()};
  }

private:
  std::string path_;
};

// In-memory store with switchable persistence capabilities.
class FakeTaskStore final : public ITaskStore {
public:
  explicit FakeTaskStore(Snapshot snapshot) : snapshot_(std::move(snapshot)) {
  }

  bool supports_partial{true};
  bool supports_bulk{true};
  std::optional<Error> fetch_error;

  int fetches{0};
  int partial_updates{0};
  int bulk_rewrites{0};
  int regenerations{0};
  std::optional<Reference> last_partial_owner;

  [[nodiscard]] auto fetch_all() -> Result<Snapshot> override {
    ++fetches;
    if (fetch_error) {
      return fail(*fetch_error);
    }
    return snapshot_;
  }

  [[nodiscard]] auto apply_partial_update(const Reference& ref,
                                          const DependencyUpdate& update)
      -> Result<void> override {
    if (!supports_partial) {
      return fail(Error::Unsupported);
    }
    auto* deps = snapshot_.mutable_dependencies(ref);
    if (deps == nullptr) {
      return fail(Error::NotFound);
    }
    ++partial_updates;
    last_partial_owner = ref;
    if (update.dependencies) {
      *deps = *update.dependencies;
      *snapshot_.mutable_malformed(ref) = update.malformed;
    }
    return ok();
  }

  [[nodiscard]] auto bulk_rewrite(const Snapshot& snapshot)
      -> Result<void> override {
    if (!supports_bulk) {
      return fail(Error::Unsupported);
    }
    ++bulk_rewrites;
    snapshot.for_each_owner(
        [this, &snapshot](const Reference& ref,
                          const std::vector<Reference>& deps) {
          if (auto* target = snapshot_.mutable_dependencies(ref)) {
            *target = deps;
            *snapshot_.mutable_malformed(ref) = *snapshot.malformed_of(ref);
          }
        });
    return ok();
  }

  auto regenerate_derived_artifacts() -> void override {
    ++regenerations;
  }

  [[nodiscard]] auto name() const noexcept -> std::string_view override {
    return "fake";
  }

  [[nodiscard]] auto stored() const -> const Snapshot& {
    return snapshot_;
  }

private:
  Snapshot snapshot_;
};

}  // namespace workgraph::test
