#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <functional>
#include <mutex>
#include <print>
#include <string>
#include <string_view>

namespace taskweave::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error,
  Off
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info",
                                        "warn",  "error", "off"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m",  // error: red
      ""           // off
  };
  return colors[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> Level {
  if (name == "trace") return Level::Trace;
  if (name == "debug") return Level::Debug;
  if (name == "warn") return Level::Warn;
  if (name == "error") return Level::Error;
  if (name == "off" || name == "silent") return Level::Off;
  return Level::Info;
}

// Receives every formatted record at or above the current level. Used by the
// CLI to mirror output into a file and by tests to capture notices.
using Sink = std::function<void(Level, std::string_view)>;

// Synchronous logger. Engine calls are short and single-threaded, so records
// are written inline under a mutex instead of through a writer thread.
class Logger {
  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> color_{true};
  std::mutex mutex_;
  std::FILE* out_{stderr};
  std::FILE* file_{nullptr};
  Sink sink_;

public:
  Logger() = default;
  ~Logger() {
    if (file_ != nullptr) {
      std::fclose(file_);
    }
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_color(bool enabled) noexcept -> void {
    color_.store(enabled, std::memory_order_release);
  }

  auto set_sink(Sink sink) -> void {
    std::lock_guard lock(mutex_);
    sink_ = std::move(sink);
  }

  // Appends records to `path` in addition to stderr. Returns false if the
  // file cannot be opened; logging to stderr continues either way.
  auto open_file(const std::string& path) -> bool {
    std::lock_guard lock(mutex_);
    if (file_ != nullptr) {
      std::fclose(file_);
      file_ = nullptr;
    }
    if (path.empty()) {
      return true;
    }
    file_ = std::fopen(path.c_str(), "a");
    return file_ != nullptr;
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire) || level == Level::Off)
      return;

    auto message = std::format(fmt, std::forward<Args>(args)...);
    auto time = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());

    std::lock_guard lock(mutex_);
    if (color_.load(std::memory_order_acquire)) {
      std::print(out_, "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] {}\n", time,
                 level_color(level), level_name(level), "\033[0m", message);
    } else {
      std::print(out_, "[{:%Y-%m-%d %H:%M:%S}] [{}] {}\n", time,
                 level_name(level), message);
    }
    if (file_ != nullptr) {
      std::print(file_, "[{:%Y-%m-%d %H:%M:%S}] [{}] {}\n", time,
                 level_name(level), message);
      std::fflush(file_);
    }
    if (sink_) {
      sink_(level, message);
    }
  }
};

inline Logger& logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace taskweave::log
