#include "bandscope/analysis_state.hpp"

#include <stdexcept>

namespace bandscope {

namespace {

bool valid_factor(float factor) noexcept {
    return factor >= 0.0f && factor < 1.0f;
}

float blend(float previous, float raw, float alpha) noexcept {
    return previous * alpha + raw * (1.0f - alpha);
}

}  // namespace

SharedAnalysisState::SharedAnalysisState(float band_smoothing, float spectrum_smoothing)
    : band_smoothing_{band_smoothing}, spectrum_smoothing_{spectrum_smoothing} {
    if (!valid_factor(band_smoothing_) || !valid_factor(spectrum_smoothing_)) {
        throw std::invalid_argument("Smoothing factors must be in [0, 1)");
    }
}

bool SharedAnalysisState::update(const AnalysisFrame& raw) {
    if (!is_finite(raw)) {
        return false;
    }

    std::lock_guard<std::mutex> lock{mutex_};

    current_.levels.bass = blend(current_.levels.bass, raw.levels.bass, band_smoothing_);
    current_.levels.mid = blend(current_.levels.mid, raw.levels.mid, band_smoothing_);
    current_.levels.treble = blend(current_.levels.treble, raw.levels.treble, band_smoothing_);

    for (std::size_t i = 0; i < kSpectrumBins; ++i) {
        current_.spectrum[i] = blend(current_.spectrum[i], raw.spectrum[i], spectrum_smoothing_);
    }

    ++generation_;
    return true;
}

BandLevels SharedAnalysisState::get_levels() const {
    std::lock_guard<std::mutex> lock{mutex_};
    return current_.levels;
}

Spectrum SharedAnalysisState::get_spectrum() const {
    std::lock_guard<std::mutex> lock{mutex_};
    return current_.spectrum;
}

AnalysisFrame SharedAnalysisState::snapshot() const {
    std::lock_guard<std::mutex> lock{mutex_};
    return current_;
}

std::uint64_t SharedAnalysisState::generation() const {
    std::lock_guard<std::mutex> lock{mutex_};
    return generation_;
}

void SharedAnalysisState::reset() {
    std::lock_guard<std::mutex> lock{mutex_};
    current_ = AnalysisFrame{};
    generation_ = 0;
}

}  // namespace bandscope
