#include "analysis.hpp"

#include <chrono>
#include <future>
#include <utility>

#include "audio.hpp"
#include "log.hpp"

namespace cuedeck {

namespace {

using std::filesystem::path;
using std::optional;
using std::span;
using std::vector;

[[nodiscard]] std::string_view to_string(beat_status status) noexcept
{
  switch (status) {
    case beat_status::ok:                  return "ok";
    case beat_status::insufficient_signal: return "insufficient signal";
    case beat_status::no_tempo:            return "no reliable tempo";
  }
  return "unknown";
}

} // namespace

result<analysis_result>
analyze(const path& file, const analysis_options& options)
{
  const auto started = std::chrono::steady_clock::now();
  const bool full = needs_full_fidelity(options);

  auto decoded = decode(file, full);
  if (!decoded) return std::unexpected(std::move(decoded.error()));
  const interleaved<float>& audio = *decoded;

  analysis_result out;
  out.duration = audio.duration();
  out.sample_rate = audio.sample_rate;

  const beat_estimate beats = estimate(audio);
  if (beats.status != beat_status::ok) {
    log_warn("{}: {}, tempo left empty", file.generic_string(), to_string(beats.status));
  }
  out.bpm = beats.bpm;

  vector<interval> intervals;
  if (!options.manual_intervals.empty()) {
    auto clamped = clamp_intervals(options.manual_intervals, out.duration);
    if (!clamped) return std::unexpected(std::move(clamped.error()));
    intervals = std::move(*clamped);
  } else if (options.auto_cues) {
    intervals = group_beats(beats.beats, options.beats_per_cue, out.duration);
  }

  if (!intervals.empty()) {
    out.cues = build_cues(audio, intervals, options.envelope_points);
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - started
  );
  log_info("Analyzed {} ({} fidelity) in {} ms: {} beats, {} cues",
           file.generic_string(), full ? "full" : "reduced", elapsed.count(),
           beats.beats.size(), out.cues.size());
  return out;
}

result<optional<double>> extract_bpm(const path& file)
{
  analysis_options options;
  options.auto_cues = false;
  auto analysis = analyze(file, options);
  if (!analysis) return std::unexpected(std::move(analysis.error()));
  return analysis->bpm;
}

result<vector<cue>>
compute_cues(const path& file, span<const interval> intervals, std::size_t envelope_points)
{
  analysis_options options;
  options.auto_cues = false;
  options.manual_intervals.assign(intervals.begin(), intervals.end());
  options.envelope_points = envelope_points;
  auto analysis = analyze(file, options);
  if (!analysis) return std::unexpected(std::move(analysis.error()));
  return std::move(analysis->cues);
}

vector<result<analysis_result>>
analyze_batch(span<const path> files, const analysis_options& options)
{
  vector<std::future<result<analysis_result>>> pending;
  pending.reserve(files.size());
  for (const auto& file: files) {
    pending.push_back(std::async(std::launch::async,
      [&options, file] { return analyze(file, options); }
    ));
  }

  vector<result<analysis_result>> results;
  results.reserve(files.size());
  for (auto& job: pending) results.push_back(job.get());
  return results;
}

} // namespace cuedeck
