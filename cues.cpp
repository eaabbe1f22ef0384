#include "cues.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "log.hpp"

namespace cuedeck {

namespace {

using std::max, std::min;
using std::size_t;
using std::span;
using std::vector;

[[nodiscard]] std::string describe_interval(size_t index, const interval& iv)
{
  return fmt::format("#{} [{:.3f}, {:.3f}]", index, iv.start, iv.end);
}

} // namespace

vector<interval>
group_beats(span<const double> beats, unsigned beats_per_cue, double duration)
{
  vector<interval> out;
  if (!(duration > 0.0)) return out;

  vector<double> times;
  times.reserve(beats.size());
  for (double t: beats) {
    if (std::isfinite(t) && t >= 0.0 && t <= duration) times.push_back(t);
  }
  std::sort(times.begin(), times.end());
  times.erase(std::unique(times.begin(), times.end()), times.end());
  if (times.empty()) return out;

  const size_t step = max(1u, beats_per_cue);
  for (size_t first = 0; first < times.size(); first += step) {
    const size_t next = first + step;
    const double start = out.empty() ? 0.0 : times[first];
    const double end = next < times.size() ? times[next] : duration;
    if (end > start) {
      out.push_back({start, end});
    } else if (!out.empty()) {
      // Last group starts on the final sample: fold it into its predecessor.
      out.back().end = duration;
    }
  }
  return out;
}

result<vector<interval>>
clamp_intervals(span<const interval> manual, double duration)
{
  struct indexed {
    size_t index;
    interval iv;
  };
  vector<indexed> kept;
  kept.reserve(manual.size());

  for (size_t i = 0; i < manual.size(); ++i) {
    const auto& iv = manual[i];
    if (!std::isfinite(iv.start) || !std::isfinite(iv.end) || !(iv.end > iv.start)) {
      return fail(error_kind::invalid_cue_interval,
        "cue interval " + describe_interval(i, iv) + " must end after it starts"
      );
    }
    const interval clamped{max(0.0, iv.start), min(iv.end, duration)};
    if (!(clamped.end > clamped.start)) {
      log_warn("Dropping cue interval {}: outside track of {} s", describe_interval(i, iv), duration);
      continue;
    }
    kept.push_back({i, clamped});
  }

  std::stable_sort(kept.begin(), kept.end(),
    [](const indexed& a, const indexed& b) { return a.iv.start < b.iv.start; }
  );

  for (size_t k = 1; k < kept.size(); ++k) {
    const auto& prev = kept[k - 1];
    const auto& cur  = kept[k];
    if (cur.iv.start < prev.iv.end) {
      return fail(error_kind::invalid_cue_interval,
        "cue intervals " + describe_interval(prev.index, prev.iv)
        + " and " + describe_interval(cur.index, cur.iv) + " overlap"
      );
    }
  }

  vector<interval> out;
  out.reserve(kept.size());
  for (const auto& k: kept) out.push_back(k.iv);
  return out;
}

vector<float>
render_envelope(const interleaved<float>& audio, double start, double end,
  size_t points)
{
  vector<float> envelope(points, 0.0f);
  if (points == 0 || audio.frames() == 0 || audio.sample_rate == 0) return envelope;

  const double sr = audio.sample_rate;
  auto to_frame = [&](double t) {
    return min(audio.frames(), static_cast<size_t>(std::floor(max(0.0, t) * sr)));
  };
  const size_t first = to_frame(start);
  const size_t last  = max(first, to_frame(end));
  const size_t length = last - first;
  if (length == 0) return envelope;

  for (size_t i = 0; i < points; ++i) {
    // Fewer frames than points: each point still covers one frame.
    const size_t a = min(first + i * length / points, last - 1);
    const size_t b = max(a + 1, first + (i + 1) * length / points);

    float peak = 0.0f;
    for (size_t f = a; f < b; ++f) peak = max(peak, audio[f].peak());
    envelope[i] = peak;
  }

  const float cue_peak = *std::max_element(envelope.begin(), envelope.end());
  if (cue_peak > 0.0f) {
    for (float& v: envelope) v = std::clamp(v / cue_peak, 0.0f, 1.0f);
  }
  return envelope;
}

vector<cue>
build_cues(const interleaved<float>& audio, span<const interval> intervals,
  size_t points)
{
  vector<cue> cues;
  cues.reserve(intervals.size());
  for (const auto& iv: intervals) {
    cues.push_back(cue{iv.start, iv.end, render_envelope(audio, iv.start, iv.end, points),
                       fmt::format("cue_{}", cues.size())});
  }
  return cues;
}

bool well_formed(span<const cue> cues) noexcept
{
  for (size_t i = 0; i < cues.size(); ++i) {
    const auto& c = cues[i];
    if (!(c.start >= 0.0) || !(c.end > c.start)) return false;
    if (i > 0 && c.start < cues[i - 1].end) return false;
    for (float v: c.waveform) {
      if (!(v >= 0.0f && v <= 1.0f)) return false;
    }
  }
  return true;
}

} // namespace cuedeck
