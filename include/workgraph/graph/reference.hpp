#pragma once

#include "workgraph/core/error.hpp"

#include <fmt/format.h>

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

namespace workgraph {

using ItemId = std::uint32_t;

// Bare integers below this value inside a subitem's dependency list name a
// sibling subitem of the same parent.
inline constexpr ItemId kSiblingReferenceLimit = 100;

struct TaskRef {
  ItemId id{0};

  friend auto operator==(const TaskRef&, const TaskRef&) -> bool = default;
  friend auto operator<=>(const TaskRef&, const TaskRef&) = default;
};

struct SubtaskRef {
  ItemId parent_id{0};
  ItemId sub_id{0};

  friend auto operator==(const SubtaskRef&, const SubtaskRef&)
      -> bool = default;
  friend auto operator<=>(const SubtaskRef&, const SubtaskRef&) = default;
};

// Canonical dependency target. Ordering puts every task reference before any
// subtask reference, tasks by id, subtasks by (parent, sub).
class Reference {
public:
  Reference() = default;
  Reference(TaskRef ref) : value_(ref) {}
  Reference(SubtaskRef ref) : value_(ref) {}

  [[nodiscard]] static auto task(ItemId id) -> Reference {
    return Reference{TaskRef{id}};
  }
  [[nodiscard]] static auto subtask(ItemId parent_id, ItemId sub_id)
      -> Reference {
    return Reference{SubtaskRef{parent_id, sub_id}};
  }

  [[nodiscard]] auto is_task() const noexcept -> bool {
    return std::holds_alternative<TaskRef>(value_);
  }
  [[nodiscard]] auto is_subtask() const noexcept -> bool {
    return std::holds_alternative<SubtaskRef>(value_);
  }

  // Top-level item id: the task itself, or the subtask's parent.
  [[nodiscard]] auto item_id() const noexcept -> ItemId;
  [[nodiscard]] auto sub_id() const noexcept -> std::optional<ItemId>;

  [[nodiscard]] auto to_string() const -> std::string;

  friend auto operator==(const Reference& lhs, const Reference& rhs) -> bool {
    return lhs.value_ == rhs.value_;
  }
  friend auto operator<=>(const Reference& lhs, const Reference& rhs)
      -> std::strong_ordering;

private:
  std::variant<TaskRef, SubtaskRef> value_;
};

// A dependency as it appears at an ingestion boundary, before normalization.
using RawReference = std::variant<std::int64_t, std::string>;

// Parses an owner or target id typed by a user: "7" or "7.2".
[[nodiscard]] auto parse_id(std::string_view raw) -> Result<Reference>;

// Resolves the sibling convention: a small integer inside the dependency list
// of a subitem of `context_parent` means subitem `context_parent.n`.
[[nodiscard]] auto normalize_reference(const RawReference& raw,
                                       std::optional<ItemId> context_parent)
    -> Result<Reference>;

inline auto operator<<(std::ostream& os, const Reference& ref)
    -> std::ostream& {
  return os << ref.to_string();
}

}  // namespace workgraph

template <>
struct std::hash<workgraph::Reference> {
  auto operator()(const workgraph::Reference& ref) const noexcept
      -> std::size_t {
    auto sub = ref.sub_id();
    std::uint64_t key = (static_cast<std::uint64_t>(ref.item_id()) << 32) |
                        (sub ? (*sub | 0x80000000U) : 0U);
    return std::hash<std::uint64_t>{}(key);
  }
};

template <>
struct fmt::formatter<workgraph::Reference>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const workgraph::Reference& ref, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(ref.to_string(), ctx);
  }
};
