#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include "audio.hpp"
#include "error.hpp"

namespace cuedeck {

inline constexpr std::size_t default_envelope_points = 100;

// A cue region with its preview envelope. Times in seconds.
struct cue {
  double start = 0.0;
  double end   = 0.0;
  std::vector<float> waveform; // values in [0, 1]
  std::string name;            // "cue_<i>" when generated

  bool operator==(const cue&) const = default;
};

struct interval {
  double start = 0.0;
  double end   = 0.0;

  bool operator==(const interval&) const = default;
};

// Partition ascending beat times into groups of beats_per_cue. The first cue
// starts at 0, the last one ends at duration; every other boundary is the
// first beat of a group.
[[nodiscard]] std::vector<interval>
group_beats(std::span<const double> beats, unsigned beats_per_cue, double duration);

// Clamp caller-supplied intervals to [0, duration] and sort them. Fails with
// invalid_cue_interval on an empty/inverted interval or an overlapping pair.
[[nodiscard]] result<std::vector<interval>>
clamp_intervals(std::span<const interval> manual, double duration);

// Peak envelope of [start, end) normalised to the region's own peak.
[[nodiscard]] std::vector<float>
render_envelope(const interleaved<float>& audio, double start, double end,
  std::size_t points = default_envelope_points);

// One cue per interval, named cue_0, cue_1, ... in order.
[[nodiscard]] std::vector<cue>
build_cues(const interleaved<float>& audio, std::span<const interval> intervals,
  std::size_t points = default_envelope_points);

// Cues sorted by start, pairwise disjoint, each with end > start >= 0.
[[nodiscard]] bool well_formed(std::span<const cue> cues) noexcept;

} // namespace cuedeck
