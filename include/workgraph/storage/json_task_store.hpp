#pragma once

#include "workgraph/storage/task_store.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace workgraph {

// Task store over a tasks.json document. Writes patch only the
// "dependencies" arrays and keep every other field of the file as loaded.
class JsonTaskStore final : public ITaskStore {
public:
  explicit JsonTaskStore(std::string_view path, std::string_view tag = {});

  [[nodiscard]] auto fetch_all() -> Result<Snapshot> override;
  [[nodiscard]] auto apply_partial_update(const Reference& ref,
                                          const DependencyUpdate& update)
      -> Result<void> override;
  [[nodiscard]] auto bulk_rewrite(const Snapshot& snapshot)
      -> Result<void> override;
  auto regenerate_derived_artifacts() -> void override;

  [[nodiscard]] auto name() const noexcept -> std::string_view override {
    return "json";
  }

  [[nodiscard]] auto path() const noexcept -> const std::string& {
    return path_;
  }

  // Called from regenerate_derived_artifacts(), e.g. to refresh task files.
  auto set_on_persisted(std::function<void()> callback) -> void {
    on_persisted_ = std::move(callback);
  }

private:
  [[nodiscard]] auto load_document() -> Result<nlohmann::json>;
  [[nodiscard]] auto save_document(const nlohmann::json& doc) -> Result<void>;
  [[nodiscard]] auto tasks_array(nlohmann::json& doc) -> nlohmann::json*;

  std::string path_;
  std::string tag_;
  std::function<void()> on_persisted_;
};

}  // namespace workgraph
