#include "audio.hpp"

#include <string>
#include <system_error>
#include <utility>

#include <samplerate.h>
#include <sndfile.hh>

#include "log.hpp"

namespace cuedeck {

namespace {

using std::filesystem::path;
using std::string;
using std::uint32_t;
using std::in_range;

[[nodiscard]] std::unexpected<error>
open_failure(const SndfileHandle& sf, const path& file)
{
  const string what = file.generic_string() + ": " + sf.strError();
  switch (sf.error()) {
    case SF_ERR_UNRECOGNISED_FORMAT:
    case SF_ERR_UNSUPPORTED_ENCODING:
      return fail(error_kind::unsupported_format, what);
    default:
      return fail(error_kind::decode_error, what);
  }
}

} // namespace

result<interleaved<float>>
decode(const path& file, bool full_fidelity)
{
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file, ec)) {
    return fail(error_kind::file_not_found,
      "Audio file not found: " + file.generic_string()
    );
  }

  SndfileHandle sf(file.string());
  if (sf.error() != SF_ERR_NO_ERROR) return open_failure(sf, file);

  const sf_count_t frames = sf.frames();
  const int sr = sf.samplerate();
  if (sr <= 0 || sf.channels() <= 0 || frames < 0) {
    return fail(error_kind::decode_error,
      "Invalid stream parameters in file: " + file.generic_string()
    );
  }

  interleaved<float> track(
    static_cast<uint32_t>(sr),
    static_cast<std::size_t>(sf.channels()),
    static_cast<std::size_t>(frames)
  );

  const sf_count_t read_frames = sf.readf(track.data(), frames);
  if (read_frames < 0) {
    return fail(error_kind::decode_error,
      "Failed to read audio data from file: " + file.generic_string()
    );
  }
  if (read_frames != frames) {
    log_warn("{}: short read, {} of {} frames", file.generic_string(), read_frames, frames);
    track.resize(static_cast<std::size_t>(read_frames));
  }

  log_debug("Decoded {}: {} frames, {} ch @ {} Hz",
            file.generic_string(), track.frames(), track.channels(), track.sample_rate);

  if (full_fidelity) return track;

  auto mono = to_mono(track);
  if (mono.frames() == 0) mono.sample_rate = reduced_sample_rate;
  if (mono.sample_rate == reduced_sample_rate) return mono;

  auto reduced = resample(mono, reduced_sample_rate);
  if (!reduced) {
    return fail(error_kind::decode_error,
      file.generic_string() + ": " + reduced.error().message
    );
  }
  return reduced;
}

interleaved<float> to_mono(const interleaved<float>& audio)
{
  interleaved<float> mono(audio.sample_rate, 1, audio.frames());
  for (std::size_t f = 0; f < audio.frames(); ++f) {
    mono[f, 0] = audio[f].average();
  }
  return mono;
}

result<interleaved<float>>
resample(const interleaved<float>& in, uint32_t to_rate)
{
  const std::size_t channels     = in.channels();
  const std::size_t in_frames_sz = in.frames();

  assert(channels > 0);
  assert(in.sample_rate > 0);
  assert(to_rate > 0);

  if (!in_range<long>(in_frames_sz))
    return fail(error_kind::decode_error,
      "Input too large for libsamplerate (frame count exceeds 'long')."
    );

  const long in_frames = static_cast<long>(in_frames_sz);
  const auto ratio = double(to_rate) / in.sample_rate;

  // Estimate output frames (add 1 for safety).
  const double est_out_frames_d = std::ceil(static_cast<double>(in_frames) * ratio) + 1.0;
  const auto   est_out_frames_sz = static_cast<std::size_t>(est_out_frames_d);

  if (!in_range<long>(est_out_frames_sz))
    return fail(error_kind::decode_error,
      "Output too large for libsamplerate (frame count exceeds 'long')."
    );

  if (!in_range<int>(channels))
    return fail(error_kind::decode_error,
      "Channel count too large for libsamplerate."
    );

  interleaved<float> out(to_rate, channels, est_out_frames_sz);

  SRC_DATA data{};
  data.data_in       = in.data();
  data.data_out      = out.data();
  data.input_frames  = in_frames;
  data.output_frames = static_cast<long>(est_out_frames_sz);
  data.end_of_input  = 1;
  data.src_ratio     = ratio;

  if (const int err = src_simple(&data, SRC_SINC_FASTEST, static_cast<int>(channels)); err != 0)
    return fail(error_kind::decode_error, src_strerror(err));

  out.resize(static_cast<std::size_t>(data.output_frames_gen));
  return out;
}

} // namespace cuedeck
