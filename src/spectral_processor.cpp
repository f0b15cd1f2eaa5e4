#include "bandscope/spectral_processor.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace bandscope {

std::string_view to_string(ProcessingAnomaly anomaly) noexcept {
    switch (anomaly) {
        case ProcessingAnomaly::UnexpectedFrameLength:
            return "unexpected frame length";
        case ProcessingAnomaly::NonFiniteSamples:
            return "non-finite samples";
        case ProcessingAnomaly::NonFiniteResult:
            return "non-finite analysis result";
    }
    return "unknown anomaly";
}

SpectralProcessor::SpectralProcessor(std::size_t frame_size, double sample_rate)
    : sample_rate_{sample_rate},
      fft_{FFTConfig{.fft_size = frame_size}} {
    if (!(sample_rate > 0.0)) {
        throw std::invalid_argument("Sample rate must be positive");
    }

    magnitudes_.resize(fft_.bin_count());

    band_bins_[0] = bins_in(kBassRange.low_hz, kBassRange.high_hz);
    band_bins_[1] = bins_in(kMidRange.low_hz, kMidRange.high_hz);
    band_bins_[2] = bins_in(kTrebleRange.low_hz, kTrebleRange.high_hz);

    const auto edges = spectrum_edges();
    for (std::size_t i = 0; i < kSpectrumBins; ++i) {
        spectrum_bins_[i] = bins_in(edges[i], edges[i + 1]);
    }
}

std::array<double, kSpectrumBins + 1> SpectralProcessor::spectrum_edges() {
    std::array<double, kSpectrumBins + 1> edges{};
    const double ratio = kSpectrumMaxHz / kSpectrumMinHz;
    for (std::size_t i = 0; i <= kSpectrumBins; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(kSpectrumBins);
        edges[i] = kSpectrumMinHz * std::pow(ratio, t);
    }
    return edges;
}

float SpectralProcessor::spectrum_reference(std::size_t bin) noexcept {
    const float t = static_cast<float>(bin) / static_cast<float>(kSpectrumBins - 1);
    return kSpectrumReferenceLow + (kSpectrumReferenceHigh - kSpectrumReferenceLow) * t;
}

BinRange SpectralProcessor::bins_in(double low_hz, double high_hz) const noexcept {
    // Bin frequencies increase monotonically, so members form one run.
    BinRange range{};
    const auto count = fft_.bin_count();

    std::size_t k = 0;
    while (k < count && !(bin_frequency(k) >= low_hz)) {
        ++k;
    }
    range.begin = k;
    while (k < count && bin_frequency(k) < high_hz) {
        ++k;
    }
    range.end = k;
    return range;
}

float SpectralProcessor::mean_magnitude(const BinRange& range) const noexcept {
    if (range.empty()) {
        return 0.0f;
    }

    double sum = 0.0;
    for (std::size_t i = range.begin; i < range.end; ++i) {
        sum += magnitudes_[i];
    }
    return static_cast<float>(sum / static_cast<double>(range.size()));
}

std::optional<ProcessingAnomaly> SpectralProcessor::validate(std::span<const float> frame) const noexcept {
    if (frame.size() != frame_size()) {
        return ProcessingAnomaly::UnexpectedFrameLength;
    }
    const bool all_finite =
        std::all_of(frame.begin(), frame.end(), [](float s) { return std::isfinite(s); });
    if (!all_finite) {
        return ProcessingAnomaly::NonFiniteSamples;
    }
    return std::nullopt;
}

AnalysisFrame SpectralProcessor::process(std::span<const float> frame) {
    fft_.compute(frame, magnitudes_);

    AnalysisFrame result;

    result.levels.bass = std::min(mean_magnitude(band_bins_[0]) / kBassDivisor, kMaxBandLevel);
    result.levels.mid = std::min(mean_magnitude(band_bins_[1]) / kMidDivisor, kMaxBandLevel);
    result.levels.treble = std::min(mean_magnitude(band_bins_[2]) / kTrebleDivisor, kMaxBandLevel);

    for (std::size_t i = 0; i < kSpectrumBins; ++i) {
        const float normalized = mean_magnitude(spectrum_bins_[i]) / spectrum_reference(i);
        result.spectrum[i] = std::min(normalized, kMaxSpectrumLevel);
    }

    return result;
}

void downmix(std::span<const float> interleaved, int channels, std::span<float> output) noexcept {
    if (channels <= 1) {
        std::copy_n(interleaved.begin(), std::min(interleaved.size(), output.size()), output.begin());
        return;
    }

    const auto stride = static_cast<std::size_t>(channels);
    const auto frames = std::min(output.size(), interleaved.size() / stride);
    const float inv = 1.0f / static_cast<float>(channels);

    for (std::size_t f = 0; f < frames; ++f) {
        float sum = 0.0f;
        for (std::size_t c = 0; c < stride; ++c) {
            sum += interleaved[f * stride + c];
        }
        output[f] = sum * inv;
    }
}

}  // namespace bandscope
