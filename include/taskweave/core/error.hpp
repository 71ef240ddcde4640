#pragma once

#include <concepts>
#include <expected>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace taskweave {

enum class Error : int {
  Success,
  FileNotFound,
  FileOpenFailed,
  FileWriteFailed,
  ParseError,
  InvalidArgument,
  NotFound,
  AlreadyExists,
  NotPresent,
  SelfDependency,
  CycleDetected,
  InvalidConcurrency,
  MalformedReference,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::string_view messages[] = {
      "success",
      "file not found",
      "failed to open file",
      "failed to write file",
      "parse error",
      "invalid argument",
      "not found",
      "dependency already exists",
      "dependency not present",
      "task cannot depend on itself",
      "dependency would create a cycle",
      "concurrency must be a positive integer",
      "malformed task reference",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "taskweave";
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

}  // namespace taskweave

template <>
struct std::is_error_code_enum<taskweave::Error> : std::true_type {};

namespace taskweave {

// AlreadyExists and NotPresent report that an edge mutation had nothing to
// do. Callers surface them as warnings and carry on.
[[nodiscard]] inline auto is_notice(std::error_code ec) noexcept -> bool {
  return ec == Error::AlreadyExists || ec == Error::NotPresent;
}

}  // namespace taskweave
