#pragma once

#include "bandscope/analysis_types.hpp"

#include <cstdint>
#include <mutex>

namespace bandscope {

/// Smoothed levels and spectrum shared between the capture thread (single
/// writer) and any number of readers.
///
/// Every update replaces the whole levels+spectrum pair under one mutex and
/// every accessor copies under the same mutex, so a reader always sees the
/// result of exactly one update() (or the zero default).
class SharedAnalysisState {
public:
    /// @param band_smoothing     EMA weight of the previous band value.
    /// @param spectrum_smoothing EMA weight of the previous spectrum value.
    /// @throws std::invalid_argument if a factor is outside [0, 1).
    explicit SharedAnalysisState(float band_smoothing = kDefaultBandSmoothing,
                                 float spectrum_smoothing = kDefaultSpectrumSmoothing);

    SharedAnalysisState(const SharedAnalysisState&) = delete;
    SharedAnalysisState& operator=(const SharedAnalysisState&) = delete;

    /// Blends a raw frame into the state: state = state * a + raw * (1 - a).
    /// A frame holding NaN or infinity is refused and the state is kept.
    /// @return false if the frame was refused.
    bool update(const AnalysisFrame& raw);

    [[nodiscard]] BandLevels get_levels() const;
    [[nodiscard]] Spectrum get_spectrum() const;

    /// Levels and spectrum from the same update.
    [[nodiscard]] AnalysisFrame snapshot() const;

    /// Number of update() calls applied so far.
    [[nodiscard]] std::uint64_t generation() const;

    /// Returns the state to its all-zero default.
    void reset();

    [[nodiscard]] float band_smoothing() const noexcept { return band_smoothing_; }
    [[nodiscard]] float spectrum_smoothing() const noexcept { return spectrum_smoothing_; }

private:
    const float band_smoothing_;
    const float spectrum_smoothing_;

    mutable std::mutex mutex_;
    AnalysisFrame current_{};
    std::uint64_t generation_ = 0;
};

}  // namespace bandscope
