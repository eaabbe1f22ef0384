#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <vector>

#include "beats.hpp"
#include "cues.hpp"
#include "error.hpp"

namespace cuedeck {

struct analysis_options {
  bool auto_cues = true;
  unsigned beats_per_cue = 4;
  std::vector<interval> manual_intervals; // takes precedence over auto_cues
  std::size_t envelope_points = default_envelope_points;
};

struct analysis_result {
  std::optional<double> bpm; // absent when the signal has no reliable tempo
  double duration = 0.0;
  std::uint32_t sample_rate = 0;
  std::vector<cue> cues;
};

// Cue envelopes need the full-resolution buffer; everything else decodes at
// the reduced rate.
[[nodiscard]] inline bool needs_full_fidelity(const analysis_options& options) noexcept
{ return options.auto_cues || !options.manual_intervals.empty(); }

// Decode, estimate tempo and beats, build cues. Component errors are passed
// through as-is.
[[nodiscard]] result<analysis_result>
analyze(const std::filesystem::path& file, const analysis_options& options = {});

[[nodiscard]] result<std::optional<double>>
extract_bpm(const std::filesystem::path& file);

[[nodiscard]] result<std::vector<cue>>
compute_cues(const std::filesystem::path& file, std::span<const interval> intervals,
  std::size_t envelope_points = default_envelope_points);

// Analyse independent files concurrently; results keep the input order.
[[nodiscard]] std::vector<result<analysis_result>>
analyze_batch(std::span<const std::filesystem::path> files,
  const analysis_options& options = {});

} // namespace cuedeck
