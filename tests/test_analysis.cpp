#include <catch2/catch.hpp>

#include <vector>

#include "analysis.hpp"
#include "ingest.hpp"
#include "synthetic.hpp"

using namespace cuedeck;
using cuedeck::test::temp_dir;

namespace {

std::filesystem::path write_click_track(const temp_dir& dir, double bpm, double seconds,
  const std::string& name = "clicks.wav")
{
  const auto file = dir / name;
  test::write_wav(test::click_track(bpm, seconds, 44100, 2, 0.25), file);
  return file;
}

std::size_t detected_beats(const std::filesystem::path& file)
{
  auto audio = decode(file, true);
  REQUIRE(audio);
  return estimate(*audio).beats.size();
}

} // namespace

TEST_CASE("analysis of a click track", "[analysis]")
{
  temp_dir dir;
  const auto file = write_click_track(dir, 120.0, 20.0);

  analysis_options options;
  options.beats_per_cue = 8;
  auto result = analyze(file, options);
  REQUIRE(result);

  REQUIRE(result->bpm);
  CHECK(*result->bpm == Approx(120.0).margin(2.0));
  CHECK(result->duration == Approx(20.0).margin(0.01));
  CHECK(result->sample_rate == 44100);

  const auto beats = detected_beats(file);
  CHECK(result->cues.size() == (beats + 7) / 8);
  CHECK(well_formed(result->cues));
  REQUIRE_FALSE(result->cues.empty());
  CHECK(result->cues.front().start == 0.0);
  CHECK(result->cues.back().end == Approx(result->duration));
  for (const auto& c: result->cues) CHECK(c.waveform.size() == default_envelope_points);
}

TEST_CASE("fast tempos keep one cue per group of beats", "[analysis]")
{
  const double tempo = GENERATE(170.0, 200.0);
  CAPTURE(tempo);

  temp_dir dir;
  const auto file = write_click_track(dir, tempo, 20.0);

  analysis_options options;
  options.beats_per_cue = 8;
  auto result = analyze(file, options);
  REQUIRE(result);
  REQUIRE(result->bpm);
  CHECK(*result->bpm == Approx(tempo).margin(2.0));

  // About tempo/3 clicks in 20 s; a halved tempo would give half the cues.
  const double clicks = 20.0 * tempo / 60.0;
  CHECK(double(result->cues.size()) > 0.8 * clicks / 8.0);
  CHECK(result->cues.size() == (detected_beats(file) + 7) / 8);
  REQUIRE_FALSE(result->cues.empty());
  CHECK(result->cues.front().name == "cue_0");
}

TEST_CASE("tempo-only analysis decodes at the reduced rate", "[analysis]")
{
  temp_dir dir;
  const auto file = write_click_track(dir, 128.0, 20.0);

  analysis_options options;
  options.auto_cues = false;
  auto result = analyze(file, options);
  REQUIRE(result);
  CHECK(result->sample_rate == reduced_sample_rate);
  CHECK(result->cues.empty());
  REQUIRE(result->bpm);
  CHECK(*result->bpm == Approx(128.0).margin(2.0));

  auto bpm = extract_bpm(file);
  REQUIRE(bpm);
  REQUIRE(*bpm);
  CHECK(**bpm == Approx(128.0).margin(2.0));
}

TEST_CASE("manual intervals win over automatic cues", "[analysis]")
{
  temp_dir dir;
  const auto file = write_click_track(dir, 120.0, 10.0);

  analysis_options options;
  options.manual_intervals = {{6.0, 12.0}, {1.0, 3.0}};
  options.envelope_points = 256;
  auto result = analyze(file, options);
  REQUIRE(result);
  REQUIRE(result->cues.size() == 2);
  CHECK(result->cues[0].start == 1.0);
  CHECK(result->cues[0].end == 3.0);
  CHECK(result->cues[1].start == 6.0);
  CHECK(result->cues[1].end == Approx(10.0));
  CHECK(result->cues[1].waveform.size() == 256);
  CHECK(result->sample_rate == 44100);

  auto cues = compute_cues(file, options.manual_intervals, 128);
  REQUIRE(cues);
  CHECK(cues->size() == 2);
}

TEST_CASE("overlapping manual intervals fail the analysis", "[analysis]")
{
  temp_dir dir;
  const auto file = write_click_track(dir, 120.0, 10.0);

  analysis_options options;
  options.manual_intervals = {{1.0, 4.0}, {3.0, 5.0}};
  auto result = analyze(file, options);
  REQUIRE_FALSE(result);
  CHECK(result.error().kind == error_kind::invalid_cue_interval);
}

TEST_CASE("silence analyses without a tempo", "[analysis]")
{
  temp_dir dir;
  const auto file = dir / "silence.wav";
  test::write_wav(test::silence(5.0), file);

  auto result = analyze(file);
  REQUIRE(result);
  CHECK_FALSE(result->bpm);
  CHECK(result->cues.empty());
  CHECK(result->duration == Approx(5.0));
}

TEST_CASE("decoder errors pass through", "[analysis]")
{
  temp_dir dir;
  auto result = analyze(dir / "missing.wav");
  REQUIRE_FALSE(result);
  CHECK(result.error().kind == error_kind::file_not_found);
}

TEST_CASE("batch analysis keeps the input order", "[analysis]")
{
  temp_dir dir;
  const std::vector<std::filesystem::path> files{
    write_click_track(dir, 100.0, 15.0, "a.wav"),
    dir / "missing.wav",
    write_click_track(dir, 128.0, 15.0, "b.wav")
  };

  analysis_options options;
  options.auto_cues = false;
  const auto results = analyze_batch(files, options);
  REQUIRE(results.size() == 3);

  REQUIRE(results[0]);
  REQUIRE(results[0]->bpm);
  CHECK(*results[0]->bpm == Approx(100.0).margin(2.0));

  REQUIRE_FALSE(results[1]);
  CHECK(results[1].error().kind == error_kind::file_not_found);

  REQUIRE(results[2]);
  REQUIRE(results[2]->bpm);
  CHECK(*results[2]->bpm == Approx(128.0).margin(2.0));
}

TEST_CASE("adding a track without audio", "[analysis][ingest]")
{
  temp_dir dir;
  track_library library(dir / "playlist.json");

  track_request request;
  request.title = "Sin audio";
  request.artist = "Nadie";
  request.genres = {"ambient"};

  auto created = add_track(library, request);
  REQUIRE(created);
  CHECK_FALSE(created->bpm);
  CHECK_FALSE(created->duration);
  CHECK(created->cues.empty());

  auto fetched = library.get(created->id);
  REQUIRE(fetched);
  CHECK(*fetched == *created);
}

TEST_CASE("adding a track with audio stores the analysis", "[analysis][ingest]")
{
  temp_dir dir;
  track_library library(dir / "playlist.json");
  const auto file = write_click_track(dir, 120.0, 20.0);

  track_request request;
  request.title = "Clicks";
  request.artist = "Metronomo";
  request.audio_path = file;
  request.beats_per_cue = 8;
  request.bpm = 90.0;

  auto created = add_track(library, request);
  REQUIRE(created);
  REQUIRE(created->bpm);
  CHECK(*created->bpm == Approx(120.0).margin(2.0));
  REQUIRE(created->duration);
  CHECK(*created->duration == Approx(20.0).margin(0.01));
  CHECK(created->cues.size() == (detected_beats(file) + 7) / 8);

  auto listed = library.list();
  REQUIRE(listed);
  REQUIRE(listed->size() == 1);
  CHECK(listed->front() == *created);
}

TEST_CASE("a failed analysis adds nothing", "[analysis][ingest]")
{
  temp_dir dir;
  const auto catalog = dir / "playlist.json";
  track_library library(catalog);

  track_request request;
  request.title = "Perdido";
  request.artist = "Nadie";
  request.audio_path = dir / "missing.wav";

  auto created = add_track(library, request);
  REQUIRE_FALSE(created);
  CHECK(created.error().kind == error_kind::file_not_found);
  CHECK_FALSE(std::filesystem::exists(catalog));
}

TEST_CASE("an unanalyzable signal keeps the requested bpm", "[analysis][ingest]")
{
  temp_dir dir;
  track_library library(dir / "playlist.json");
  const auto file = dir / "silence.wav";
  test::write_wav(test::silence(4.0), file);

  track_request request;
  request.title = "Silencio";
  request.artist = "Nadie";
  request.audio_path = file;
  request.bpm = 95.0;

  auto created = add_track(library, request);
  REQUIRE(created);
  CHECK(created->bpm == 95.0);
  REQUIRE(created->duration);
  CHECK(*created->duration == Approx(4.0));
}

TEST_CASE("reanalysis updates an existing track", "[analysis][ingest]")
{
  temp_dir dir;
  track_library library(dir / "playlist.json");
  const auto file = write_click_track(dir, 128.0, 20.0);

  auto created = library.create(test::sample_track());
  REQUIRE(created);

  analysis_options options;
  options.auto_cues = false;
  auto updated = reanalyze_track(library, created->id, file, options);
  REQUIRE(updated);
  REQUIRE(updated->bpm);
  CHECK(*updated->bpm == Approx(128.0).margin(2.0));
  CHECK(updated->title == created->title);
  CHECK(updated->cues.empty());

  const auto quiet = dir / "silence.wav";
  test::write_wav(test::silence(3.0), quiet);
  auto cleared = reanalyze_track(library, created->id, quiet, options);
  REQUIRE(cleared);
  CHECK_FALSE(cleared->bpm);
  REQUIRE(cleared->duration);
  CHECK(*cleared->duration == Approx(3.0));

  auto missing = reanalyze_track(library, "missing", file, options);
  REQUIRE_FALSE(missing);
  CHECK(missing.error().kind == error_kind::track_not_found);
}
