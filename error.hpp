#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace cuedeck {

enum class error_kind {
  file_not_found,
  unsupported_format,
  decode_error,
  insufficient_signal,
  invalid_cue_interval,
  track_not_found,
  duplicate_id,
  storage_write_failure,
  invalid_record,
  catalog_unreadable,
  invalid_request
};

[[nodiscard]] std::string_view to_string(error_kind kind) noexcept;

struct error {
  error_kind kind;
  std::string message;
};

template<typename T>
using result = std::expected<T, error>;

[[nodiscard]] inline std::unexpected<error>
fail(error_kind kind, std::string message)
{ return std::unexpected(error{kind, std::move(message)}); }

// "<kind>: <message>", for diagnostics.
[[nodiscard]] std::string describe(const error& e);

} // namespace cuedeck
