#pragma once

#include <algorithm>
#include <cassert>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <numeric>
#include <ranges>
#include <span>
#include <vector>

#include "error.hpp"

namespace cuedeck {

template<std::floating_point T>
[[nodiscard]] constexpr T dbamp(T db) noexcept
{ return std::pow(T(10.0), db * T(0.05)); }

// Rate used for BPM-only decoding.
inline constexpr std::uint32_t reduced_sample_rate = 22050;

template<std::ranges::input_range R>
[[nodiscard]] auto abs_peak(const R& samples) noexcept
{
  using T = std::ranges::range_value_t<R>;
  return std::transform_reduce(std::ranges::begin(samples), std::ranges::end(samples), T(0),
    [](T a, T b) { return std::max(a, b); },
    [](T v) { return std::abs(v); }
  );
}

template<typename T>
class interleaved {
  std::vector<T> storage;
  std::size_t frames_   = 0;
  std::size_t channels_ = 0;

public:
  std::uint32_t sample_rate = 0;

  interleaved() = default;

  interleaved(std::uint32_t sr, std::size_t ch, std::size_t frames)
  : storage(frames * ch), frames_(frames), channels_(ch), sample_rate(sr)
  { assert(ch > 0); }

  // move-only
  interleaved(const interleaved&) = delete;
  interleaved& operator=(const interleaved&) = delete;

  interleaved(interleaved&&) noexcept = default;
  interleaved& operator=(interleaved&&) noexcept = default;

  [[nodiscard]] std::size_t frames()   const noexcept { return frames_; }
  [[nodiscard]] double      duration() const noexcept
  { return sample_rate ? double(frames()) / sample_rate : 0.0; }
  [[nodiscard]] std::size_t channels() const noexcept { return channels_; }
  [[nodiscard]] T*          data()       noexcept     { return storage.data(); }
  [[nodiscard]] const T*    data() const noexcept     { return storage.data(); }

  template<typename Elem>
  class frame_view {
    std::span<Elem> row;

  public:
    frame_view(Elem* row, std::size_t ch) : row(row, ch) {}

    [[nodiscard]] T average() const noexcept
    { return std::reduce(row.begin(), row.end(), T(0)) / T(row.size()); }

    [[nodiscard]] T peak() const noexcept
    { return abs_peak(row); }
  };

  // 2D element access via multi-arg operator[]
  T& operator[](std::size_t frame, std::size_t ch) noexcept {
    assert(frame < frames_ && ch < channels_);
    return storage[frame * channels_ + ch];
  }
  const T& operator[](std::size_t frame, std::size_t ch) const noexcept
  {
    assert(frame < frames_ && ch < channels_);
    return storage[frame * channels_ + ch];
  }

  // 1D frame view
  frame_view<T> operator[](std::size_t frame) noexcept
  {
    assert(frame < frames_);
    return { storage.data() + frame * channels_, channels_ };
  }
  const frame_view<const T> operator[](std::size_t frame) const noexcept
  {
    assert(frame < frames_);
    return { storage.data() + frame * channels_, channels_ };
  }

  [[nodiscard]] T peak() const noexcept
  { return abs_peak(storage); }

  void resize(std::size_t new_frames)
  {
    storage.resize(new_frames * channels_);
    frames_ = new_frames;
  }
};

// Load an audio file. With full_fidelity the native rate and channel layout
// are kept; otherwise the result is mono at reduced_sample_rate.
[[nodiscard]] result<interleaved<float>>
decode(const std::filesystem::path& file, bool full_fidelity);

// Average all channels into one.
[[nodiscard]] interleaved<float> to_mono(const interleaved<float>& audio);

[[nodiscard]] result<interleaved<float>>
resample(const interleaved<float>& in, std::uint32_t to_rate);

} // namespace cuedeck
