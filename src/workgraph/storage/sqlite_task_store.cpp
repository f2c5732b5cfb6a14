#include "workgraph/storage/sqlite_task_store.hpp"

#include "workgraph/storage/json_codec.hpp"
#include "workgraph/storage/state_strings.hpp"
#include "workgraph/util/log.hpp"

#include <nlohmann/json.hpp>
#include <sqlite3.h>

#include <unordered_map>
#include <utility>

namespace workgraph {

namespace {

auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return p ? p : "";
}

auto col_id(sqlite3_stmt* stmt, int col) -> ItemId {
  return static_cast<ItemId>(sqlite3_column_int64(stmt, col));
}

auto bind_text(sqlite3_stmt* stmt, int col, std::string_view text) -> void {
  sqlite3_bind_text(stmt, col, text.data(), static_cast<int>(text.size()),
                    SQLITE_TRANSIENT);
}

auto parse_deps(const std::string& deps_str, const Reference& owner)
    -> DecodedDependencies {
  if (deps_str.empty()) {
    return {};
  }
  try {
    auto deps_json = nlohmann::json::parse(deps_str);
    if (!deps_json.is_array()) {
      log::warn("deps of {} is not an array", owner);
      return {};
    }
    return decode_canonical(deps_json);
  } catch (const nlohmann::json::exception& e) {
    log::warn("Failed to parse deps JSON for {}: {}", owner, e.what());
  }
  return {};
}

auto malformed_or_empty(const Snapshot& snapshot, const Reference& ref)
    -> std::vector<std::string> {
  const auto* malformed = snapshot.malformed_of(ref);
  return malformed ? *malformed : std::vector<std::string>{};
}

}  // namespace

auto SqliteTaskStore::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db)
    sqlite3_close(db);
}

SqliteTaskStore::Statement::~Statement() {
  reset();
}

auto SqliteTaskStore::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

SqliteTaskStore::SqliteTaskStore(std::string_view db_path)
    : db_path_(db_path) {
}

SqliteTaskStore::~SqliteTaskStore() {
  close();
}

auto SqliteTaskStore::open() -> Result<void> {
  if (db_) {
    return ok();
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open(db_path_.c_str(), &raw_db);
  if (rc != SQLITE_OK) {
    log::error("Failed to open database: {}", sqlite3_errmsg(raw_db));
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return fail(Error::DatabaseOpenFailed);
  }
  db_.reset(raw_db);

  if (auto r = execute("PRAGMA journal_mode=WAL;"); !r) {
    log::warn("Failed to set WAL mode: {}", r.error().message());
  }
  if (auto r = execute("PRAGMA foreign_keys=ON;"); !r) {
    log::warn("Failed to enable foreign keys: {}", r.error().message());
  }

  if (auto r = create_tables(); !r) {
    close();
    return r;
  }

  log::debug("Database opened: {}", db_path_);
  return ok();
}

auto SqliteTaskStore::close() -> void {
  db_.reset();
}

auto SqliteTaskStore::create_tables() -> Result<void> {
  const char* sql = R"(
    CREATE TABLE IF NOT EXISTS items (
      id INTEGER PRIMARY KEY,
      position INTEGER NOT NULL DEFAULT 0,
      title TEXT DEFAULT '',
      status TEXT NOT NULL DEFAULT 'pending',
      priority TEXT NOT NULL DEFAULT 'medium',
      deps TEXT DEFAULT '[]'
    );

    CREATE TABLE IF NOT EXISTS subitems (
      parent_id INTEGER NOT NULL,
      id INTEGER NOT NULL,
      position INTEGER NOT NULL DEFAULT 0,
      title TEXT DEFAULT '',
      status TEXT NOT NULL DEFAULT 'pending',
      priority TEXT NOT NULL DEFAULT 'medium',
      deps TEXT DEFAULT '[]',
      PRIMARY KEY (parent_id, id),
      FOREIGN KEY (parent_id) REFERENCES items(id) ON DELETE CASCADE
    );
  )";
  return execute(sql);
}

auto SqliteTaskStore::execute(std::string_view sql) -> Result<void> {
  char* err_msg = nullptr;
  std::string sql_str{sql};
  int rc = sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    log::error("SQL error: {}", err_msg ? err_msg : "unknown");
    sqlite3_free(err_msg);
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto SqliteTaskStore::prepare(const char* sql) -> Result<sqlite3_stmt*> {
  if (!db_) {
    log::error("Database {} is not open", db_path_);
    return fail(Error::DatabaseError);
  }
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return stmt;
}

auto SqliteTaskStore::begin_transaction() -> Result<void> {
  return execute("BEGIN TRANSACTION;");
}

auto SqliteTaskStore::commit_transaction() -> Result<void> {
  return execute("COMMIT;");
}

auto SqliteTaskStore::rollback_transaction() -> Result<void> {
  return execute("ROLLBACK;");
}

auto SqliteTaskStore::import_snapshot(const Snapshot& snapshot)
    -> Result<void> {
  if (auto r = begin_transaction(); !r)
    return r;

  if (auto r = execute("DELETE FROM subitems; DELETE FROM items;"); !r) {
    (void)rollback_transaction();
    return r;
  }

  auto item_sql = prepare(R"(
    INSERT INTO items (id, position, title, status, priority, deps)
    VALUES (?, ?, ?, ?, ?, ?);
  )");
  if (!item_sql) {
    (void)rollback_transaction();
    return std::unexpected(item_sql.error());
  }
  Statement item_stmt(*item_sql);

  auto sub_sql = prepare(R"(
    INSERT INTO subitems (parent_id, id, position, title, status, priority, deps)
    VALUES (?, ?, ?, ?, ?, ?, ?);
  )");
  if (!sub_sql) {
    (void)rollback_transaction();
    return std::unexpected(sub_sql.error());
  }
  Statement sub_stmt(*sub_sql);

  int position = 0;
  for (const auto& item : snapshot.items) {
    sqlite3_reset(item_stmt.get());
    sqlite3_clear_bindings(item_stmt.get());

    auto deps_str =
        encode_canonical(item.dependencies, item.malformed_dependencies).dump();
    sqlite3_bind_int64(item_stmt.get(), 1, item.id);
    sqlite3_bind_int(item_stmt.get(), 2, position++);
    bind_text(item_stmt.get(), 3, item.title);
    bind_text(item_stmt.get(), 4, item_status_name(item.status));
    bind_text(item_stmt.get(), 5, priority_name(item.priority));
    bind_text(item_stmt.get(), 6, deps_str);

    if (sqlite3_step(item_stmt.get()) != SQLITE_DONE) {
      log::error("Failed to import item {}: {}", item.id,
                 sqlite3_errmsg(db_.get()));
      (void)rollback_transaction();
      return fail(Error::DatabaseQueryFailed);
    }

    int sub_position = 0;
    for (const auto& sub : item.subtasks) {
      sqlite3_reset(sub_stmt.get());
      sqlite3_clear_bindings(sub_stmt.get());

      auto sub_deps_str =
          encode_canonical(sub.dependencies, sub.malformed_dependencies).dump();
      sqlite3_bind_int64(sub_stmt.get(), 1, item.id);
      sqlite3_bind_int64(sub_stmt.get(), 2, sub.id);
      sqlite3_bind_int(sub_stmt.get(), 3, sub_position++);
      bind_text(sub_stmt.get(), 4, sub.title);
      bind_text(sub_stmt.get(), 5, item_status_name(sub.status));
      bind_text(sub_stmt.get(), 6, priority_name(sub.priority));
      bind_text(sub_stmt.get(), 7, sub_deps_str);

      if (sqlite3_step(sub_stmt.get()) != SQLITE_DONE) {
        log::error("Failed to import subtask {}.{}: {}", item.id, sub.id,
                   sqlite3_errmsg(db_.get()));
        (void)rollback_transaction();
        return fail(Error::DatabaseQueryFailed);
      }
    }
  }
  return commit_transaction();
}

auto SqliteTaskStore::fetch_all() -> Result<Snapshot> {
  auto item_sql = prepare(R"(
    SELECT id, title, status, priority, deps FROM items ORDER BY position, id;
  )");
  if (!item_sql)
    return std::unexpected(item_sql.error());
  Statement item_stmt(*item_sql);

  std::vector<Item> items;
  std::unordered_map<ItemId, std::size_t> positions;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(item_stmt.get())) == SQLITE_ROW) {
    Item item;
    item.id = col_id(item_stmt.get(), 0);
    item.title = col_text(item_stmt.get(), 1);
    item.status = parse_item_status(col_text(item_stmt.get(), 2));
    item.priority = parse_priority(col_text(item_stmt.get(), 3));
    auto deps = parse_deps(col_text(item_stmt.get(), 4), item.ref());
    item.dependencies = std::move(deps.references);
    item.malformed_dependencies = std::move(deps.malformed);
    positions.emplace(item.id, items.size());
    items.push_back(std::move(item));
  }
  if (rc != SQLITE_DONE) {
    log::error("Failed to read items: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }

  auto sub_sql = prepare(R"(
    SELECT parent_id, id, title, status, priority, deps FROM subitems
    ORDER BY parent_id, position, id;
  )");
  if (!sub_sql)
    return std::unexpected(sub_sql.error());
  Statement sub_stmt(*sub_sql);

  while ((rc = sqlite3_step(sub_stmt.get())) == SQLITE_ROW) {
    Subitem sub;
    sub.parent_id = col_id(sub_stmt.get(), 0);
    sub.id = col_id(sub_stmt.get(), 1);
    sub.title = col_text(sub_stmt.get(), 2);
    sub.status = parse_item_status(col_text(sub_stmt.get(), 3));
    sub.priority = parse_priority(col_text(sub_stmt.get(), 4));
    auto deps = parse_deps(col_text(sub_stmt.get(), 5), sub.ref());
    sub.dependencies = std::move(deps.references);
    sub.malformed_dependencies = std::move(deps.malformed);

    auto it = positions.find(sub.parent_id);
    if (it == positions.end()) {
      log::warn("Skipping orphan subtask {}", sub.ref());
      continue;
    }
    items[it->second].subtasks.push_back(std::move(sub));
  }
  if (rc != SQLITE_DONE) {
    log::error("Failed to read subitems: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }

  return make_snapshot(std::move(items));
}

auto SqliteTaskStore::update_dependencies(
    const Reference& ref, const std::vector<Reference>& deps,
    const std::vector<std::string>& malformed) -> Result<void> {
  const char* sql = ref.is_task()
                        ? "UPDATE items SET deps = ? WHERE id = ?;"
                        : "UPDATE subitems SET deps = ? WHERE parent_id = ? "
                          "AND id = ?;";
  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  auto deps_str = encode_canonical(deps, malformed).dump();
  bind_text(stmt.get(), 1, deps_str);
  sqlite3_bind_int64(stmt.get(), 2, ref.item_id());
  if (ref.is_subtask()) {
    sqlite3_bind_int64(stmt.get(), 3, *ref.sub_id());
  }

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    log::error("Failed to update dependencies of {}: {}", ref,
               sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }

  if (sqlite3_changes(db_.get()) == 0) {
    return fail(Error::NotFound);
  }
  return ok();
}

auto SqliteTaskStore::apply_partial_update(const Reference& ref,
                                           const DependencyUpdate& update)
    -> Result<void> {
  if (!update.dependencies) {
    return ok();
  }
  return update_dependencies(ref, *update.dependencies, update.malformed);
}

auto SqliteTaskStore::bulk_rewrite(const Snapshot& snapshot) -> Result<void> {
  if (auto r = begin_transaction(); !r)
    return r;

  Result<void> status = ok();
  snapshot.for_each_owner(
      [&](const Reference& ref, const std::vector<Reference>& deps) {
        if (status) {
          status = update_dependencies(ref, deps,
                                       malformed_or_empty(snapshot, ref));
        }
      });

  if (!status) {
    (void)rollback_transaction();
    return status;
  }
  return commit_transaction();
}

auto SqliteTaskStore::regenerate_derived_artifacts() -> void {
  log::debug("No derived artifacts for {}", db_path_);
}

}  // namespace workgraph
