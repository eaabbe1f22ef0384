#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "analysis.hpp"
#include "error.hpp"
#include "track.hpp"
#include "trackdb.hpp"

namespace cuedeck {

// Everything a client sends to add a track.
struct track_request {
  std::string title;
  std::string artist;
  std::optional<std::filesystem::path> audio_path;
  std::vector<interval> intervals;
  bool auto_cues = true;
  unsigned beats_per_cue = 4;
  std::size_t envelope_points = default_envelope_points;
  std::set<std::string> genres;
  std::map<std::string, std::string> sources;
  std::string notes;
  std::optional<double> bpm;
  std::vector<cue> cues;
};

[[nodiscard]] analysis_options options_for(const track_request& request);

// Build the record: request fields, overlaid with the analysis when given.
[[nodiscard]] track
make_track(const track_request& request, const std::optional<analysis_result>& analysis);

// Patch carrying an analysis result. Cues are only replaced when some were
// requested.
[[nodiscard]] track_patch
analysis_patch(const analysis_result& analysis, const analysis_options& options);

// Analyse (when an audio path is given) and create. Analysis runs before any
// store access, so a failed analysis leaves the catalog untouched.
[[nodiscard]] result<track>
add_track(track_library& library, const track_request& request);

// Analyse a file and merge the result into an existing track.
[[nodiscard]] result<track>
reanalyze_track(track_library& library, const std::string& id,
  const std::filesystem::path& audio, const analysis_options& options);

} // namespace cuedeck
