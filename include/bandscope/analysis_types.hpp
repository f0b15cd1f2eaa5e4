#pragma once

#include "bandscope/constants.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace bandscope {

/// Loudness per perceptual band. Each value is in [0, kMaxBandLevel].
struct BandLevels {
    float bass = 0.0f;
    float mid = 0.0f;
    float treble = 0.0f;

    friend bool operator==(const BandLevels&, const BandLevels&) = default;
};

/// Log-spaced spectrum. Each value is in [0, kMaxSpectrumLevel].
using Spectrum = std::array<float, kSpectrumBins>;

/// One processed frame, or one published state: always a complete pair.
struct AnalysisFrame {
    BandLevels levels{};
    Spectrum spectrum{};
};

/// True when every level and spectrum value is a finite number.
[[nodiscard]] inline bool is_finite(const AnalysisFrame& frame) noexcept {
    const auto finite = [](float v) { return std::isfinite(v); };
    return finite(frame.levels.bass) && finite(frame.levels.mid) && finite(frame.levels.treble) &&
           std::all_of(frame.spectrum.begin(), frame.spectrum.end(), finite);
}

}  // namespace bandscope
