#pragma once

#include "bandscope/analysis_types.hpp"
#include "bandscope/fft_processor.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace bandscope {

/// Why a captured frame was rejected.
enum class ProcessingAnomaly {
    UnexpectedFrameLength,
    NonFiniteSamples,
    NonFiniteResult  // Finite input that overflowed inside the FFT
};

inline constexpr std::size_t kProcessingAnomalyCount = 3;

[[nodiscard]] std::string_view to_string(ProcessingAnomaly anomaly) noexcept;

/// Contiguous run of FFT bins [begin, end) whose frequencies fall inside a
/// half-open frequency range.
struct BinRange {
    std::size_t begin = 0;
    std::size_t end = 0;

    [[nodiscard]] bool empty() const noexcept { return begin >= end; }
    [[nodiscard]] std::size_t size() const noexcept { return empty() ? 0 : end - begin; }
};

/// Turns one mono frame into raw (unsmoothed) band levels and spectrum.
///
/// Hann window, real FFT magnitude, then averaging of FFT bins into the
/// three fixed bands and 64 log-spaced bins. Every membership test is
/// half-open (f >= low && f < high), so a bin sitting exactly on an edge
/// belongs to the upper range only.
///
/// Holds no state between calls other than precomputed tables; temporal
/// smoothing is the caller's job.
class SpectralProcessor {
public:
    /// @throws std::invalid_argument if frame_size < 2 or sample_rate <= 0.
    SpectralProcessor(std::size_t frame_size, double sample_rate);

    /// Checks a frame before processing.
    /// @return the anomaly that disqualifies it, or nullopt if it is usable.
    [[nodiscard]] std::optional<ProcessingAnomaly> validate(std::span<const float> frame) const noexcept;

    /// Analyzes one frame of exactly frame_size() samples.
    /// Values above the caps are clamped; a NaN is passed through so the
    /// caller can reject the frame with is_finite().
    /// @throws std::invalid_argument on a length mismatch.
    [[nodiscard]] AnalysisFrame process(std::span<const float> frame);

    [[nodiscard]] std::size_t frame_size() const noexcept { return fft_.fft_size(); }
    [[nodiscard]] double sample_rate() const noexcept { return sample_rate_; }

    /// Frequency of FFT bin k: k * sample_rate / frame_size.
    [[nodiscard]] double bin_frequency(std::size_t k) const noexcept {
        return fft_.bin_to_frequency(k, sample_rate_);
    }

    /// FFT bins feeding bass, mid and treble, in that order.
    [[nodiscard]] const std::array<BinRange, 3>& band_bins() const noexcept { return band_bins_; }

    /// FFT bins feeding each spectrum bin.
    [[nodiscard]] const std::array<BinRange, kSpectrumBins>& spectrum_bins() const noexcept {
        return spectrum_bins_;
    }

    /// The kSpectrumBins + 1 geometric edges, 20 * (16000/20)^(i/64).
    [[nodiscard]] static std::array<double, kSpectrumBins + 1> spectrum_edges();

    /// Divisor for spectrum bin i, linear from 40.0 (bin 0) to 3.0 (bin 63).
    [[nodiscard]] static float spectrum_reference(std::size_t bin) noexcept;

private:
    [[nodiscard]] BinRange bins_in(double low_hz, double high_hz) const noexcept;
    [[nodiscard]] float mean_magnitude(const BinRange& range) const noexcept;

    double sample_rate_;
    FFTProcessor fft_;
    std::vector<float> magnitudes_;
    std::array<BinRange, 3> band_bins_{};
    std::array<BinRange, kSpectrumBins> spectrum_bins_{};
};

/// Averages interleaved multi-channel samples into one mono frame.
/// `interleaved` holds output.size() * channels samples.
void downmix(std::span<const float> interleaved, int channels, std::span<float> output) noexcept;

}  // namespace bandscope
