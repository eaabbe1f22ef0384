#pragma once

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <string>

#include <nlohmann/json.hpp>

#include "analysis.hpp"
#include "error.hpp"
#include "ingest.hpp"
#include "track.hpp"

namespace cuedeck {

// Accepted range of "max_muestras_cue", and its value when absent.
inline constexpr std::size_t min_request_envelope_points = 128;
inline constexpr std::size_t max_request_envelope_points = 16384;
inline constexpr std::size_t default_request_envelope_points = 2048;

struct analysis_request {
  std::filesystem::path file;
  analysis_options options;
};

// JSON request documents. Shape errors are reported as invalid_request
// naming the offending key; interval semantics are left to the pipeline.
[[nodiscard]] result<analysis_request> parse_analysis_request(const nlohmann::json& j);
[[nodiscard]] result<track_request> parse_track_request(const nlohmann::json& j);
[[nodiscard]] result<track_patch> parse_track_patch(const nlohmann::json& j);

// {bpm (number or null), duracion, sample_rate, cues}
void to_json(nlohmann::json& j, const analysis_result& r);

[[nodiscard]] result<nlohmann::json> read_json(std::istream& in, const std::string& origin);

// Reads a file, or standard input for "-".
[[nodiscard]] result<nlohmann::json> read_json_document(const std::string& source);

} // namespace cuedeck
