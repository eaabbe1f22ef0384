#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace cuedeck {

// Error: the requested operation failed.
// Warn:  degraded result or suspicious input, shown by default.
// Info:  lifecycle summaries (commits, timings).
// Debug: algorithm internals.
enum class log_level { error = 0, warn = 1, info = 2, debug = 3 };

void set_log_level(log_level level) noexcept;
[[nodiscard]] log_level get_log_level() noexcept;

[[nodiscard]] inline bool log_enabled(log_level level) noexcept
{ return static_cast<int>(level) <= static_cast<int>(get_log_level()); }

[[nodiscard]] std::string_view to_string(log_level level) noexcept;

namespace detail {

void write_log_line(log_level level, std::string_view message);

template<typename... Args>
void log(log_level level, fmt::format_string<Args...> format, Args&&... args)
{
  if (!log_enabled(level)) return;
  write_log_line(level, fmt::format(format, std::forward<Args>(args)...));
}

} // namespace detail

template<typename... Args>
void log_error(fmt::format_string<Args...> format, Args&&... args)
{ detail::log(log_level::error, format, std::forward<Args>(args)...); }

template<typename... Args>
void log_warn(fmt::format_string<Args...> format, Args&&... args)
{ detail::log(log_level::warn, format, std::forward<Args>(args)...); }

template<typename... Args>
void log_info(fmt::format_string<Args...> format, Args&&... args)
{ detail::log(log_level::info, format, std::forward<Args>(args)...); }

template<typename... Args>
void log_debug(fmt::format_string<Args...> format, Args&&... args)
{ detail::log(log_level::debug, format, std::forward<Args>(args)...); }

} // namespace cuedeck
