#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include "audio.hpp"

namespace cuedeck {

struct beat_tracker_params {
  unsigned window = 1024;        // analysis frame, samples
  unsigned hop    = 512;
  double min_bpm  = 50.0;
  double max_bpm  = 220.0;
  double prior_bpm = 120.0;      // centre of the log-normal tempo prior
  double prior_octaves = 1.0;    // its standard deviation
  double tightness = 100.0;      // DP penalty on deviation from the period
  double min_periodicity = 0.1;  // normalised autocorrelation needed for a tempo
  double harmonic_ratio = 0.5;   // half-lag peak share that halves the period
  double silence_db = -90.0;
};

enum class beat_status {
  ok,
  insufficient_signal, // silent, or shorter than one analysis frame
  no_tempo             // signal present but no reliable periodicity
};

struct beat_estimate {
  beat_status status = beat_status::no_tempo;
  std::optional<double> bpm;
  std::vector<double> beats; // seconds, ascending
};

// Spectral-flux onset strength, one value per hop.
[[nodiscard]] std::vector<float>
onset_strength(const interleaved<float>& audio, unsigned window, unsigned hop);

// Dominant beat period of an onset envelope, in (fractional) frames.
[[nodiscard]] std::optional<double>
estimate_period(std::span<const float> envelope, double frame_rate,
  const beat_tracker_params& params = {});

// Dynamic-programming beat tracker. Returns ascending frame indices.
[[nodiscard]] std::vector<std::size_t>
track_beats(std::span<const float> envelope, double period, double tightness);

// Least-squares tempo through the beat times; nullopt when the beats do not
// form a clean grid.
[[nodiscard]] std::optional<double>
fit_tempo(std::span<const double> beats, double period_sec);

[[nodiscard]] beat_estimate
estimate(const interleaved<float>& audio, const beat_tracker_params& params = {});

} // namespace cuedeck
