#pragma once

#include <cstddef>
#include <cstdint>

namespace bandscope {

/// Number of log-spaced spectrum bins published to consumers.
inline constexpr std::size_t kSpectrumBins = 64;

/// Default capture read size (frames per blocking read, also FFT size).
inline constexpr std::size_t kDefaultBufferSize = 2048;

/// Used when neither an override nor a resolved device provides a rate.
inline constexpr std::uint32_t kFallbackSampleRate = 44100;

/// Half-open frequency range [low_hz, high_hz).
struct FrequencyRange {
    double low_hz;
    double high_hz;
};

inline constexpr FrequencyRange kBassRange{20.0, 250.0};
inline constexpr FrequencyRange kMidRange{250.0, 4000.0};
inline constexpr FrequencyRange kTrebleRange{4000.0, 16000.0};

// Raw band magnitude is divided by these before clamping.
inline constexpr float kBassDivisor = 50.0f;
inline constexpr float kMidDivisor = 10.0f;
inline constexpr float kTrebleDivisor = 3.0f;

inline constexpr float kMaxBandLevel = 2.0f;
inline constexpr float kMaxSpectrumLevel = 1.5f;

/// Spectrum edges span [kSpectrumMinHz, kSpectrumMaxHz] geometrically.
inline constexpr double kSpectrumMinHz = 20.0;
inline constexpr double kSpectrumMaxHz = 16000.0;

/// Per-bin normalization reference, linear from first to last bin.
inline constexpr float kSpectrumReferenceLow = 40.0f;
inline constexpr float kSpectrumReferenceHigh = 3.0f;

inline constexpr float kDefaultBandSmoothing = 0.7f;
inline constexpr float kDefaultSpectrumSmoothing = 0.6f;

}  // namespace bandscope
