#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <vector>

namespace bandscope {

/// Configuration for FFT processing.
struct FFTConfig {
    std::size_t fft_size = 2048;  // Any size >= 2
};

/// Computes the Hann-windowed real-input FFT of a frame and returns the
/// unnormalized magnitude of each non-negative frequency bin.
///
/// Window: w[i] = 0.5 - 0.5 * cos(2*pi*i / (N - 1)).
///
/// The processor owns the FFTW plan and aligned buffers, so repeated calls
/// don't allocate. Output depends only on the input frame.
///
/// Thread safety: NOT thread-safe. One instance per producer thread.
class FFTProcessor {
public:
    /// Allocates FFTW plan and internal buffers.
    /// @throws std::invalid_argument if fft_size < 2.
    /// @throws std::runtime_error if FFTW allocation or planning fails.
    explicit FFTProcessor(const FFTConfig& config = {});

    ~FFTProcessor();

    // Non-copyable (FFTW plans are not copyable)
    FFTProcessor(const FFTProcessor&) = delete;
    FFTProcessor& operator=(const FFTProcessor&) = delete;

    /// Computes |X[k]| for k = 0..fft_size/2.
    ///
    /// @param samples Exactly fft_size input samples.
    /// @param output  Buffer with capacity >= bin_count().
    /// @throws std::invalid_argument on a size mismatch.
    void compute(std::span<const float> samples, std::span<float> output);

    /// Returns the number of output magnitude bins (fft_size / 2 + 1).
    [[nodiscard]] std::size_t bin_count() const noexcept { return config_.fft_size / 2 + 1; }

    [[nodiscard]] std::size_t fft_size() const noexcept { return config_.fft_size; }

    /// Returns the frequency (Hz) of a bin: k * sample_rate / fft_size.
    [[nodiscard]] double bin_to_frequency(std::size_t bin_index, double sample_rate) const noexcept {
        return static_cast<double>(bin_index) * sample_rate / static_cast<double>(config_.fft_size);
    }

    /// Precomputed window coefficients, one per input sample.
    [[nodiscard]] std::span<const float> window() const noexcept { return window_; }

private:
    void allocate_buffers();
    void compute_window();

    FFTConfig config_;

    // FFTW resources (opaque to avoid including fftw3.h)
    struct FFTWData;
    std::unique_ptr<FFTWData> fftw_;

    std::vector<float> window_;
};

}  // namespace bandscope
