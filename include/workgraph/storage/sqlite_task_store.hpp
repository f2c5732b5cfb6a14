#pragma once

#include "workgraph/storage/task_store.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace workgraph {

// Task store backed by a SQLite database. Dependency lists are kept as JSON
// arrays of canonical reference strings in the `deps` column of the `items`
// and `subitems` tables; entries that name no item are kept as stored.
class SqliteTaskStore final : public ITaskStore {
public:
  explicit SqliteTaskStore(std::string_view db_path);
  ~SqliteTaskStore() override;

  SqliteTaskStore(const SqliteTaskStore&) = delete;
  SqliteTaskStore& operator=(const SqliteTaskStore&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return db_ != nullptr;
  }

  // Replaces the stored items with the contents of `snapshot`.
  [[nodiscard]] auto import_snapshot(const Snapshot& snapshot) -> Result<void>;

  [[nodiscard]] auto fetch_all() -> Result<Snapshot> override;
  [[nodiscard]] auto apply_partial_update(const Reference& ref,
                                          const DependencyUpdate& update)
      -> Result<void> override;
  [[nodiscard]] auto bulk_rewrite(const Snapshot& snapshot)
      -> Result<void> override;
  auto regenerate_derived_artifacts() -> void override;

  [[nodiscard]] auto name() const noexcept -> std::string_view override {
    return "sqlite";
  }

  [[nodiscard]] auto begin_transaction() -> Result<void>;
  [[nodiscard]] auto commit_transaction() -> Result<void>;
  [[nodiscard]] auto rollback_transaction() -> Result<void>;

private:
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<sqlite3_stmt*>;
  [[nodiscard]] auto update_dependencies(
      const Reference& ref, const std::vector<Reference>& deps,
      const std::vector<std::string>& malformed) -> Result<void>;

  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  class Statement {
  public:
    explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {
    }
    ~Statement();
    Statement(Statement&& other) noexcept
        : stmt_(std::exchange(other.stmt_, nullptr)) {
    }
    Statement& operator=(Statement&& other) noexcept {
      if (this != &other) {
        reset();
        stmt_ = std::exchange(other.stmt_, nullptr);
      }
      return *this;
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* {
      return stmt_;
    }
    auto reset() -> void;

  private:
    sqlite3_stmt* stmt_ = nullptr;
  };

  std::string db_path_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
};

}  // namespace workgraph
