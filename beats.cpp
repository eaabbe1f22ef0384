#include "beats.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <limits>
#include <memory>
#include <numeric>
#include <stdexcept>

#include <aubio/aubio.h>
#include <boost/math/statistics/linear_regression.hpp>

#include "log.hpp"

namespace cuedeck {

namespace {

using boost::math::statistics::simple_ordinary_least_squares_with_R_squared;
using std::abs, std::clamp, std::max, std::min;
using std::optional, std::nullopt;
using std::ptrdiff_t;
using std::runtime_error;
using std::size_t;
using std::span;
using std::unique_ptr;
using std::vector;

using aubio_pvoc_ptr     = unique_ptr<aubio_pvoc_t,     decltype(&del_aubio_pvoc)>;
using aubio_specdesc_ptr = unique_ptr<aubio_specdesc_t, decltype(&del_aubio_specdesc)>;
using cvec_ptr           = unique_ptr<cvec_t,           decltype(&del_cvec)>;
using fvec_ptr           = unique_ptr<fvec_t,           decltype(&del_fvec)>;

template<typename F> void
for_each_mono_chunk(interleaved<float> const &audio, fvec_t *buffer, F &&f)
{
  const size_t hop = buffer->length;
  for (size_t start = 0; start < audio.frames(); start += hop) {
    const size_t n = min(hop, audio.frames() - start);
    for (size_t i = 0; i < n; ++i) buffer->data[i] = audio[start + i].average();
    std::fill(buffer->data + n, buffer->data + hop, smpl_t(0));
    f(buffer);
  }
}

// Scale to unit standard deviation and smooth with a narrow Gaussian, so a
// click smeared over two frames still correlates at a fractional period.
[[nodiscard]] vector<float> condition_envelope(span<const float> raw)
{
  const size_t n = raw.size();
  if (n == 0) return {};

  const double mean = std::accumulate(raw.begin(), raw.end(), 0.0) / double(n);
  double var = 0.0;
  for (float v: raw) var += (v - mean) * (v - mean);
  const double sd = std::sqrt(var / double(n));
  if (!(sd > 0.0)) return vector<float>(n, 0.0f);

  constexpr int radius = 3;
  std::array<double, 2 * radius + 1> kernel{};
  double kernel_sum = 0.0;
  for (int k = -radius; k <= radius; ++k) {
    kernel[k + radius] = std::exp(-0.5 * k * k);
    kernel_sum += kernel[k + radius];
  }

  vector<float> out(n);
  for (size_t i = 0; i < n; ++i) {
    double acc = 0.0;
    for (int k = -radius; k <= radius; ++k) {
      const auto j = static_cast<ptrdiff_t>(i) + k;
      if (j < 0 || j >= static_cast<ptrdiff_t>(n)) continue;
      acc += kernel[k + radius] * raw[static_cast<size_t>(j)];
    }
    out[i] = static_cast<float>(acc / kernel_sum / sd);
  }
  return out;
}

// Centre of analysis frame `f` in seconds.
[[nodiscard]] double frame_time(size_t f, const beat_tracker_params& p, double sample_rate)
{
  const double end = double(f + 1) * p.hop;
  return max(0.0, end - 0.5 * p.window) / sample_rate;
}

} // namespace

vector<float>
onset_strength(const interleaved<float>& audio, unsigned window, unsigned hop)
{
  if (window == 0 || hop == 0 || hop > window) {
    throw std::invalid_argument("onset_strength: invalid frame geometry");
  }

  aubio_pvoc_ptr pvoc{ new_aubio_pvoc(window, hop), &del_aubio_pvoc };
  if (!pvoc) throw runtime_error("aubio: failed to create phase vocoder");

  aubio_specdesc_ptr flux{
    new_aubio_specdesc("specflux", window), &del_aubio_specdesc
  };
  if (!flux) throw runtime_error("aubio: failed to create spectral flux descriptor");

  cvec_ptr grain{ new_cvec(window), &del_cvec };
  fvec_ptr inbuf{ new_fvec(hop), &del_fvec };
  fvec_ptr desc { new_fvec(1), &del_fvec };
  if (!grain || !inbuf || !desc) {
    throw runtime_error("aubio: failed to allocate onset buffers");
  }

  vector<float> envelope;
  envelope.reserve(audio.frames() / hop + 1);

  for_each_mono_chunk(audio, inbuf.get(), [&](fvec_t *buffer) {
    aubio_pvoc_do(pvoc.get(), buffer, grain.get());
    aubio_specdesc_do(flux.get(), grain.get(), desc.get());
    envelope.push_back(static_cast<float>(fvec_get_sample(desc.get(), 0)));
  });

  return envelope;
}

optional<double>
estimate_period(span<const float> envelope, double frame_rate,
  const beat_tracker_params& params)
{
  const size_t n = envelope.size();
  if (n < 4 || !(frame_rate > 0.0)) return nullopt;

  const size_t lag_min = max<size_t>(1,
    static_cast<size_t>(std::floor(60.0 * frame_rate / params.max_bpm))
  );
  const size_t lag_max = min(n - 2,
    static_cast<size_t>(std::ceil(60.0 * frame_rate / params.min_bpm))
  );
  if (lag_max <= lag_min) return nullopt;

  const double mean =
    std::accumulate(envelope.begin(), envelope.end(), 0.0) / double(n);
  vector<double> x(n);
  for (size_t i = 0; i < n; ++i) x[i] = envelope[i] - mean;

  auto autocorr = [&x](size_t lag) {
    double sum = 0.0;
    for (size_t i = 0; i + lag < x.size(); ++i) sum += x[i] * x[i + lag];
    return sum;
  };

  const double ac0 = autocorr(0);
  if (!(ac0 > 0.0)) return nullopt;

  // One extra lag on each side for the peak test and interpolation.
  vector<double> ac(lag_max + 2, 0.0);
  for (size_t lag = lag_min - 1; lag <= lag_max + 1; ++lag) ac[lag] = autocorr(lag);

  auto prior = [&](size_t lag) {
    const double bpm = 60.0 * frame_rate / double(lag);
    const double octaves = std::log2(bpm / params.prior_bpm) / params.prior_octaves;
    return std::exp(-0.5 * octaves * octaves);
  };

  auto is_peak = [&](size_t lag) {
    return lag >= lag_min && lag <= lag_max && ac[lag] > 0.0
      && ac[lag] >= ac[lag - 1] && ac[lag] >= ac[lag + 1];
  };

  optional<size_t> best;
  double best_score = 0.0;
  for (size_t lag = lag_min; lag <= lag_max; ++lag) {
    if (!is_peak(lag)) continue;
    const double score = ac[lag] * prior(lag);
    if (!best || score > best_score) {
      best = lag;
      best_score = score;
    }
  }
  if (!best) return nullopt;

  // A pulse train correlates almost as well at twice its period, and the prior
  // can favour that octave. Step down while the half lag is itself a strong peak.
  for (;;) {
    const auto half = static_cast<size_t>(std::lround(double(*best) / 2.0));
    optional<size_t> harmonic;
    for (size_t lag = max<size_t>(half, 1) - 1; lag <= half + 1; ++lag) {
      if (lag < *best && is_peak(lag) && (!harmonic || ac[lag] > ac[*harmonic])) harmonic = lag;
    }
    if (!harmonic || ac[*harmonic] < params.harmonic_ratio * ac[*best]) break;
    log_debug("Tempo octave: lag {} -> {}", *best, *harmonic);
    best = harmonic;
  }

  const size_t lag = *best;
  const double periodicity = ac[lag] / ac0;
  if (periodicity < params.min_periodicity) {
    log_debug("Tempo rejected: periodicity {:.3f} at lag {}", periodicity, lag);
    return nullopt;
  }

  double period = double(lag);
  const double curvature = ac[lag - 1] - 2.0 * ac[lag] + ac[lag + 1];
  if (curvature < 0.0) {
    period += clamp(0.5 * (ac[lag - 1] - ac[lag + 1]) / curvature, -0.5, 0.5);
  }

  log_debug("Tempo candidate: lag {} -> period {:.3f} frames ({:.2f} BPM), periodicity {:.3f}",
            lag, period, 60.0 * frame_rate / period, periodicity);
  return period;
}

vector<size_t>
track_beats(span<const float> envelope, double period, double tightness)
{
  const size_t n = envelope.size();
  if (n == 0 || !(period > 1.0)) return {};

  const auto max_back = static_cast<size_t>(std::round(2.0 * period));
  const auto min_back = max<size_t>(1, static_cast<size_t>(std::round(0.5 * period)));

  // Transition cost and deviation per predecessor distance.
  vector<double> penalty(max_back + 1, 0.0);
  vector<double> deviation(max_back + 1, 0.0);
  for (size_t d = min_back; d <= max_back; ++d) {
    deviation[d] = abs(std::log(double(d) / period));
    penalty[d] = tightness * deviation[d] * deviation[d];
  }

  vector<double> score(n, 0.0);
  vector<ptrdiff_t> backlink(n, -1);

  for (size_t t = 0; t < n; ++t) {
    double best = -std::numeric_limits<double>::infinity();
    double best_dev = std::numeric_limits<double>::infinity();
    ptrdiff_t best_prev = -1;

    for (size_t d = min_back; d <= max_back && d <= t; ++d) {
      const size_t prev = t - d;
      const double s = score[prev] - penalty[d];
      // Equal scores: the interval closer to the period wins.
      if (s > best || (s == best && deviation[d] < best_dev)) {
        best = s;
        best_dev = deviation[d];
        best_prev = static_cast<ptrdiff_t>(prev);
      }
    }

    score[t] = envelope[t];
    if (best_prev >= 0) {
      score[t] += best;
      backlink[t] = best_prev;
    }
  }

  // The chain ends at the last local maximum of the cumulative score that
  // reaches half the median local maximum.
  vector<size_t> peaks;
  for (size_t t = 1; t + 1 < n; ++t) {
    if (score[t] > score[t - 1] && score[t] >= score[t + 1]) peaks.push_back(t);
  }

  size_t last = 0;
  if (peaks.empty()) {
    last = static_cast<size_t>(
      std::distance(score.begin(), std::max_element(score.begin(), score.end()))
    );
  } else {
    vector<double> values;
    values.reserve(peaks.size());
    for (size_t t: peaks) values.push_back(score[t]);
    auto mid = values.begin() + values.size() / 2;
    std::nth_element(values.begin(), mid, values.end());
    const double median = *mid;
    const double threshold = median > 0.0
      ? 0.5 * median : -std::numeric_limits<double>::infinity();
    last = peaks.back();
    for (auto it = peaks.rbegin(); it != peaks.rend(); ++it) {
      if (score[*it] >= threshold) {
        last = *it;
        break;
      }
    }
  }

  vector<size_t> beats;
  for (ptrdiff_t t = static_cast<ptrdiff_t>(last); t >= 0; t = backlink[static_cast<size_t>(t)]) {
    beats.push_back(static_cast<size_t>(t));
  }
  std::reverse(beats.begin(), beats.end());

  // Drop weak beats at both ends (lead-in and tail silence).
  if (beats.empty()) return beats;
  double sum_sq = 0.0;
  for (size_t b: beats) sum_sq += double(envelope[b]) * envelope[b];
  const double threshold = 0.5 * std::sqrt(sum_sq / double(beats.size()));
  auto strong = [&](size_t b) { return envelope[b] >= threshold; };

  auto first_strong = std::find_if(beats.begin(), beats.end(), strong);
  auto last_strong  = std::find_if(beats.rbegin(), beats.rend(), strong).base();
  if (first_strong >= last_strong) return {};
  return vector<size_t>(first_strong, last_strong);
}

optional<double>
fit_tempo(span<const double> beats, double period_sec)
{
  if (beats.size() < 4 || !(period_sec > 0.0)) return nullopt;

  // Beat index k for each time; a skipped beat advances k by more than one.
  vector<double> beat_indices{0.0};
  vector<double> beat_times{beats.front()};
  beat_indices.reserve(beats.size());
  beat_times.reserve(beats.size());
  for (size_t i = 1; i < beats.size(); ++i) {
    const double steps = max(1.0, std::round((beats[i] - beats[i - 1]) / period_sec));
    beat_indices.push_back(beat_indices.back() + steps);
    beat_times.push_back(beats[i]);
  }

  auto [A, B, R2] = simple_ordinary_least_squares_with_R_squared(
    beat_indices, beat_times
  );

  if (!(B > 0.0) || R2 < 0.9) {
    log_debug("Grid fit rejected: period {:.4f}s, R2 {:.3f}", B, R2);
    return nullopt;
  }
  log_debug("Grid fit: offset {:.4f}s, period {:.4f}s, R2 {:.5f}", A, B, R2);
  return 60.0 / B;
}

beat_estimate
estimate(const interleaved<float>& audio, const beat_tracker_params& params)
{
  beat_estimate out;

  if (audio.sample_rate == 0 || audio.channels() == 0
      || audio.frames() < params.window) {
    out.status = beat_status::insufficient_signal;
    log_debug("Beat estimate: buffer shorter than one analysis frame");
    return out;
  }
  if (audio.peak() < dbamp(static_cast<float>(params.silence_db))) {
    out.status = beat_status::insufficient_signal;
    log_debug("Beat estimate: silent buffer");
    return out;
  }

  const double sample_rate = audio.sample_rate;
  const double frame_rate = sample_rate / params.hop;
  const auto envelope = condition_envelope(
    onset_strength(audio, params.window, params.hop)
  );

  const auto period = estimate_period(envelope, frame_rate, params);
  if (!period) {
    out.status = beat_status::no_tempo;
    return out;
  }

  const auto frames = track_beats(envelope, *period, params.tightness);
  if (frames.size() < 2) {
    out.status = beat_status::no_tempo;
    log_debug("Beat estimate: tracker found {} beats", frames.size());
    return out;
  }

  out.beats.reserve(frames.size());
  for (size_t f: frames) out.beats.push_back(frame_time(f, params, sample_rate));

  const double period_bpm = 60.0 * frame_rate / *period;
  double bpm = period_bpm;
  if (auto fitted = fit_tempo(out.beats, *period / frame_rate);
      fitted && abs(*fitted - period_bpm) <= 0.08 * period_bpm) {
    bpm = *fitted;
  }

  out.status = beat_status::ok;
  out.bpm = bpm;
  log_debug("Beat estimate: {} beats, {:.2f} BPM (autocorrelation {:.2f})",
            out.beats.size(), bpm, period_bpm);
  return out;
}

} // namespace cuedeck
