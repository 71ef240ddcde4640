#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string_view>
#include <utility>

namespace taskweave {

enum class Status : std::uint8_t {
  Pending,
  InProgress,
  Done,
  Deferred,
  Cancelled,
  Blocked,
  Review,
};

enum class Priority : std::uint8_t {
  Critical,
  High,
  Medium,
  Low,
};

namespace detail {

constexpr std::array<std::string_view, 7> kStatusNames = {
    "pending", "in-progress", "done", "deferred",
    "cancelled", "blocked", "review",
};

constexpr std::array<std::string_view, 4> kPriorityNames = {
    "critical",
    "high",
    "medium",
    "low",
};

}  // namespace detail

[[nodiscard]] inline auto status_name(Status status) noexcept -> const char* {
  auto idx = std::to_underlying(status);
  return idx < detail::kStatusNames.size() ? detail::kStatusNames[idx].data()
                                           : "unknown";
}

// "completed" is accepted as a legacy spelling of "done".
[[nodiscard]] inline auto parse_status(std::string_view name) noexcept
    -> std::optional<Status> {
  if (name == "completed") {
    return Status::Done;
  }
  auto it = std::ranges::find(detail::kStatusNames, name);
  if (it == detail::kStatusNames.end()) {
    return std::nullopt;
  }
  return static_cast<Status>(
      std::ranges::distance(detail::kStatusNames.begin(), it));
}

[[nodiscard]] inline auto priority_name(Priority priority) noexcept
    -> const char* {
  auto idx = std::to_underlying(priority);
  return idx < detail::kPriorityNames.size()
             ? detail::kPriorityNames[idx].data()
             : "medium";
}

[[nodiscard]] inline auto parse_priority(std::string_view name) noexcept
    -> std::optional<Priority> {
  auto it = std::ranges::find(detail::kPriorityNames, name);
  if (it == detail::kPriorityNames.end()) {
    return std::nullopt;
  }
  return static_cast<Priority>(
      std::ranges::distance(detail::kPriorityNames.begin(), it));
}

// Higher is more urgent: critical=4 ... low=1.
[[nodiscard]] constexpr auto priority_rank(Priority priority) noexcept -> int {
  return 4 - static_cast<int>(std::to_underlying(priority));
}

[[nodiscard]] constexpr auto is_done(Status status) noexcept -> bool {
  return status == Status::Done;
}

// Pending and in-progress work can still be handed out.
[[nodiscard]] constexpr auto is_open(Status status) noexcept -> bool {
  return status == Status::Pending || status == Status::InProgress;
}

}  // namespace taskweave
