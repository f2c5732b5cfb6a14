#include "workgraph/graph/reference.hpp"

#include <charconv>
#include <limits>

namespace workgraph {

namespace {

auto parse_positive(std::string_view text) -> std::optional<ItemId> {
  while (!text.empty() && text.front() == ' ') text.remove_prefix(1);
  while (!text.empty() && text.back() == ' ') text.remove_suffix(1);
  if (text.empty()) {
    return std::nullopt;
  }
  ItemId value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                   value);
  if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

auto Reference::item_id() const noexcept -> ItemId {
  if (const auto* t = std::get_if<TaskRef>(&value_)) {
    return t->id;
  }
  return std::get<SubtaskRef>(value_).parent_id;
}

auto Reference::sub_id() const noexcept -> std::optional<ItemId> {
  if (const auto* s = std::get_if<SubtaskRef>(&value_)) {
    return s->sub_id;
  }
  return std::nullopt;
}

auto Reference::to_string() const -> std::string {
  if (const auto* s = std::get_if<SubtaskRef>(&value_)) {
    return fmt::format("{}.{}", s->parent_id, s->sub_id);
  }
  return fmt::format("{}", std::get<TaskRef>(value_).id);
}

auto operator<=>(const Reference& lhs, const Reference& rhs)
    -> std::strong_ordering {
  if (auto cmp = lhs.value_.index() <=> rhs.value_.index(); cmp != 0) {
    return cmp;
  }
  if (lhs.is_task()) {
    return std::get<TaskRef>(lhs.value_) <=> std::get<TaskRef>(rhs.value_);
  }
  return std::get<SubtaskRef>(lhs.value_) <=> std::get<SubtaskRef>(rhs.value_);
}

auto parse_id(std::string_view raw) -> Result<Reference> {
  return normalize_reference(RawReference{std::string(raw)}, std::nullopt);
}

auto normalize_reference(const RawReference& raw,
                         std::optional<ItemId> context_parent)
    -> Result<Reference> {
  if (const auto* number = std::get_if<std::int64_t>(&raw)) {
    if (*number <= 0 || *number > std::numeric_limits<ItemId>::max()) {
      return fail(Error::InvalidArgument);
    }
    auto id = static_cast<ItemId>(*number);
    if (context_parent && id < kSiblingReferenceLimit) {
      return Reference::subtask(*context_parent, id);
    }
    return Reference::task(id);
  }

  std::string_view text = std::get<std::string>(raw);
  auto dot = text.find('.');
  if (dot == std::string_view::npos) {
    auto id = parse_positive(text);
    if (!id) {
      return fail(Error::InvalidArgument);
    }
    return Reference::task(*id);
  }

  auto parent = parse_positive(text.substr(0, dot));
  auto sub = parse_positive(text.substr(dot + 1));
  if (!parent || !sub) {
    return fail(Error::InvalidArgument);
  }
  return Reference::subtask(*parent, *sub);
}

}  // namespace workgraph
