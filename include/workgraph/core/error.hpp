#pragma once

#include <concepts>
#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace workgraph {

enum class Error : int {
  Success,
  NotFound,
  AlreadyExists,
  SelfDependency,
  CircularDependency,
  Unsupported,
  MalformedRange,
  InvalidArgument,
  ParseError,
  FileNotFound,
  FileOpenFailed,
  DatabaseError,
  DatabaseOpenFailed,
  DatabaseQueryFailed,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::string_view messages[] = {
      "success",
      "item or dependency target not found",
      "dependency already exists",
      "item cannot depend on itself",
      "dependency would create a cycle",
      "operation not supported by task store",
      "malformed range specification",
      "invalid argument",
      "parse error",
      "file not found",
      "failed to open file",
      "database error",
      "failed to open database",
      "database query failed",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "workgraph";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unknown error";
    }
    return std::string{messages[idx]};
  }
};

inline auto error_category() -> const ErrorCategory& {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T>
using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T&& value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> {
  return {};
}

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

}  // namespace workgraph

template <>
struct std::is_error_code_enum<workgraph::Error> : std::true_type {};
