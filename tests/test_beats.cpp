#include <catch2/catch.hpp>

#include <cmath>
#include <cstddef>
#include <vector>

#include "beats.hpp"
#include "synthetic.hpp"

using namespace cuedeck;

namespace {

// Onset envelope of a click every 60/bpm seconds, each click split between its
// two nearest frames and blurred like a real spectral-flux peak.
std::vector<float> pulse_envelope(double bpm, double frame_rate, double seconds = 30.0)
{
  const auto n = static_cast<std::size_t>(seconds * frame_rate);
  std::vector<float> raw(n, 0.0f);
  for (double t = 0.25; t < seconds; t += 60.0 / bpm) {
    const double f = t * frame_rate;
    const auto i = static_cast<std::size_t>(f);
    const auto w = static_cast<float>(f - double(i));
    if (i < n) raw[i] += 1.0f - w;
    if (i + 1 < n) raw[i + 1] += w;
  }

  std::vector<float> out(n, 0.0f);
  for (std::size_t i = 0; i < n; ++i) {
    for (int k = -3; k <= 3; ++k) {
      const auto j = static_cast<std::ptrdiff_t>(i) + k;
      if (j < 0 || j >= static_cast<std::ptrdiff_t>(n)) continue;
      out[i] += static_cast<float>(std::exp(-0.5 * k * k)) * raw[static_cast<std::size_t>(j)];
    }
  }
  return out;
}

} // namespace

TEST_CASE("click tracks give their tempo", "[beats]")
{
  const double tempo = GENERATE(55.0, 60.0, 90.0, 100.0, 120.0, 128.0, 140.0,
                                170.0, 180.0, 200.0, 215.0);
  CAPTURE(tempo);

  const auto audio = test::click_track(tempo, 30.0, 44100, 1, 0.25);
  const auto result = estimate(audio);

  REQUIRE(result.status == beat_status::ok);
  REQUIRE(result.bpm);
  CHECK(*result.bpm == Approx(tempo).margin(2.0));

  // Roughly one beat per click, ascending, inside the buffer.
  const double expected_beats = 30.0 * tempo / 60.0;
  CHECK(double(result.beats.size()) > 0.8 * expected_beats);
  CHECK(double(result.beats.size()) < 1.2 * expected_beats);
  for (std::size_t i = 1; i < result.beats.size(); ++i) {
    CHECK(result.beats[i] > result.beats[i - 1]);
  }
  CHECK(result.beats.front() >= 0.0);
  CHECK(result.beats.back() <= audio.duration());
}

TEST_CASE("the reduced-rate buffer gives the same tempo", "[beats]")
{
  const double tempo = GENERATE(55.0, 90.0, 120.0, 170.0, 180.0, 200.0, 215.0);
  CAPTURE(tempo);

  const auto full = test::click_track(tempo, 30.0, 44100, 2, 0.25);
  auto reduced = resample(to_mono(full), reduced_sample_rate);
  REQUIRE(reduced);

  const auto result = estimate(*reduced);
  REQUIRE(result.status == beat_status::ok);
  REQUIRE(result.bpm);
  CHECK(*result.bpm == Approx(tempo).margin(2.0));
}

TEST_CASE("silence has no beats", "[beats]")
{
  const auto result = estimate(test::silence(10.0));
  CHECK(result.status == beat_status::insufficient_signal);
  CHECK_FALSE(result.bpm);
  CHECK(result.beats.empty());
}

TEST_CASE("a buffer shorter than one frame has no beats", "[beats]")
{
  const auto audio = test::click_track(120.0, 0.01, 44100);
  REQUIRE(audio.frames() < beat_tracker_params{}.window);

  const auto result = estimate(audio);
  CHECK(result.status == beat_status::insufficient_signal);
  CHECK_FALSE(result.bpm);
  CHECK(result.beats.empty());
}

TEST_CASE("an empty buffer has no beats", "[beats]")
{
  const interleaved<float> audio;
  const auto result = estimate(audio);
  CHECK(result.status == beat_status::insufficient_signal);
  CHECK(result.beats.empty());
}

TEST_CASE("estimate_period finds the spacing of an impulse train", "[beats]")
{
  std::vector<float> envelope(600, 0.0f);
  for (std::size_t i = 5; i < envelope.size(); i += 20) envelope[i] = 1.0f;

  // 20 frames at 40 frames/s is 120 BPM.
  const auto period = estimate_period(envelope, 40.0);
  REQUIRE(period);
  CHECK(*period == Approx(20.0).margin(0.5));
}

TEST_CASE("estimate_period does not halve fast tempos", "[beats]")
{
  // Frame rates of full-rate and reduced-rate analysis with a 512 hop.
  const double frame_rate = GENERATE(44100.0 / 512, 22050.0 / 512);
  const double tempo = GENERATE(55.0, 60.0, 150.0, 170.0, 180.0, 200.0, 215.0);
  CAPTURE(frame_rate, tempo);

  const auto period = estimate_period(pulse_envelope(tempo, frame_rate), frame_rate);
  REQUIRE(period);
  CHECK(60.0 * frame_rate / *period == Approx(tempo).margin(2.0));
}

TEST_CASE("estimate_period gives up on a flat envelope", "[beats]")
{
  const std::vector<float> envelope(600, 1.0f);
  CHECK_FALSE(estimate_period(envelope, 40.0));
}

TEST_CASE("track_beats follows the impulses", "[beats]")
{
  std::vector<float> envelope(400, 0.0f);
  std::vector<std::size_t> impulses;
  for (std::size_t i = 10; i < envelope.size(); i += 25) {
    envelope[i] = 1.0f;
    impulses.push_back(i);
  }

  const auto beats = track_beats(envelope, 25.0, 100.0);
  CHECK(beats == impulses);
}

TEST_CASE("track_beats breaks ties toward the tempo grid", "[beats]")
{
  // With no transition penalty, frame 20 can chain from frame 8 (12 frames
  // back), frame 12 (8 back) or frames 13 to 15 with the same score. 12 frames
  // is closest to the period of 10 in log terms, so frame 8 must win.
  std::vector<float> envelope(26, 0.0f);
  for (std::size_t i: {0, 8, 12, 20}) envelope[i] = 1.0f;

  const auto beats = track_beats(envelope, 10.0, 0.0);
  CHECK(beats == std::vector<std::size_t>{0, 8, 20});
}

TEST_CASE("track_beats of an empty envelope", "[beats]")
{
  CHECK(track_beats({}, 20.0, 100.0).empty());
}

TEST_CASE("fit_tempo through a regular grid", "[beats]")
{
  std::vector<double> beats;
  for (int i = 0; i < 16; ++i) beats.push_back(0.3 + i * 0.5);

  const auto bpm = fit_tempo(beats, 0.5);
  REQUIRE(bpm);
  CHECK(*bpm == Approx(120.0));
}

TEST_CASE("fit_tempo bridges a skipped beat", "[beats]")
{
  const std::vector<double> beats{0.0, 0.5, 1.0, 2.0, 2.5, 3.0};
  const auto bpm = fit_tempo(beats, 0.5);
  REQUIRE(bpm);
  CHECK(*bpm == Approx(120.0));
}

TEST_CASE("fit_tempo needs a handful of beats", "[beats]")
{
  const std::vector<double> beats{0.0, 0.5, 1.0};
  CHECK_FALSE(fit_tempo(beats, 0.5));
}
