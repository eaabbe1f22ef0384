#include "ingest.hpp"

#include <utility>

#include "log.hpp"

namespace cuedeck {

using std::optional;

analysis_options options_for(const track_request& request)
{
  analysis_options options;
  options.auto_cues = request.auto_cues;
  options.beats_per_cue = request.beats_per_cue;
  options.manual_intervals = request.intervals;
  options.envelope_points = request.envelope_points;
  return options;
}

track make_track(const track_request& request, const optional<analysis_result>& analysis)
{
  track t;
  t.title = request.title;
  t.artist = request.artist;
  t.genres = request.genres;
  t.sources = request.sources;
  t.notes = request.notes;
  t.bpm = request.bpm;
  t.cues = request.cues;

  if (analysis) {
    // An unanalyzable signal keeps the caller's bpm.
    if (analysis->bpm) t.bpm = analysis->bpm;
    t.duration = analysis->duration;
    if (needs_full_fidelity(options_for(request))) t.cues = analysis->cues;
  }
  return t;
}

track_patch analysis_patch(const analysis_result& analysis, const analysis_options& options)
{
  track_patch patch;
  patch.bpm = analysis.bpm;
  patch.clear_bpm = !analysis.bpm;
  patch.duration = analysis.duration;
  if (needs_full_fidelity(options)) patch.cues = analysis.cues;
  return patch;
}

result<track> add_track(track_library& library, const track_request& request)
{
  optional<analysis_result> analysis;
  if (request.audio_path) {
    auto analyzed = analyze(*request.audio_path, options_for(request));
    if (!analyzed) return std::unexpected(std::move(analyzed.error()));
    analysis = std::move(*analyzed);
  }

  auto created = library.create(make_track(request, analysis));
  if (created) {
    log_info("Added track {} ({} - {})", created->id, created->artist, created->title);
  }
  return created;
}

result<track>
reanalyze_track(track_library& library, const std::string& id,
  const std::filesystem::path& audio, const analysis_options& options)
{
  // Fail fast on unknown ids; update() re-checks under the lock.
  if (auto existing = library.get(id); !existing)
    return std::unexpected(std::move(existing.error()));

  auto analysis = analyze(audio, options);
  if (!analysis) return std::unexpected(std::move(analysis.error()));

  return library.update(id, analysis_patch(*analysis, options));
}

} // namespace cuedeck
