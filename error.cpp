#include "error.hpp"

namespace cuedeck {

std::string_view to_string(error_kind kind) noexcept
{
  switch (kind) {
    case error_kind::file_not_found:        return "file not found";
    case error_kind::unsupported_format:    return "unsupported format";
    case error_kind::decode_error:          return "decode error";
    case error_kind::insufficient_signal:   return "insufficient signal";
    case error_kind::invalid_cue_interval:  return "invalid cue interval";
    case error_kind::track_not_found:       return "track not found";
    case error_kind::duplicate_id:          return "duplicate id";
    case error_kind::storage_write_failure: return "storage write failure";
    case error_kind::invalid_record:        return "invalid record";
    case error_kind::catalog_unreadable:    return "catalog unreadable";
    case error_kind::invalid_request:       return "invalid request";
  }
  return "unknown error";
}

std::string describe(const error& e)
{
  std::string out(to_string(e.kind));
  if (!e.message.empty()) {
    out += ": ";
    out += e.message;
  }
  return out;
}

} // namespace cuedeck
