#include "log.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>

#include <fmt/format.h>

namespace cuedeck {

namespace {

std::atomic<int> g_log_level{static_cast<int>(log_level::warn)};
std::mutex g_log_mutex;

} // namespace

void set_log_level(log_level level) noexcept
{ g_log_level.store(static_cast<int>(level), std::memory_order_relaxed); }

log_level get_log_level() noexcept
{ return static_cast<log_level>(g_log_level.load(std::memory_order_relaxed)); }

std::string_view to_string(log_level level) noexcept
{
  switch (level) {
    case log_level::error: return "error";
    case log_level::warn:  return "warn";
    case log_level::info:  return "info";
    case log_level::debug: return "debug";
  }
  return "debug";
}

namespace detail {

void write_log_line(log_level level, std::string_view message)
{
  // Analyses log from worker threads; keep lines whole.
  std::lock_guard lock(g_log_mutex);
  fmt::print(stderr, "[cuedeck][{}] {}\n", to_string(level), message);
}

} // namespace detail

} // namespace cuedeck
