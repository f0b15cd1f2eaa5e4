#include "bandscope/fft_processor.hpp"

#include <fftw3.h>

#include <cmath>
#include <mutex>
#include <numbers>
#include <stdexcept>
#include <string>

namespace bandscope {

namespace {

// FFTW planner and plan destruction are not re-entrant.
std::mutex g_planner_mutex;

}  // namespace

/// Internal FFTW data structures (hidden from header).
struct FFTProcessor::FFTWData {
    fftwf_plan plan = nullptr;
    float* input = nullptr;           // FFTW-aligned input buffer
    fftwf_complex* output = nullptr;  // FFTW-aligned output buffer

    ~FFTWData() {
        if (plan != nullptr) {
            std::lock_guard<std::mutex> lock{g_planner_mutex};
            fftwf_destroy_plan(plan);
        }
        if (input != nullptr) {
            fftwf_free(input);
        }
        if (output != nullptr) {
            fftwf_free(output);
        }
    }
};

FFTProcessor::FFTProcessor(const FFTConfig& config)
    : config_{config}, fftw_{std::make_unique<FFTWData>()} {
    if (config_.fft_size < 2) {
        throw std::invalid_argument("FFT size must be at least 2");
    }

    allocate_buffers();
    compute_window();
}

FFTProcessor::~FFTProcessor() = default;

void FFTProcessor::allocate_buffers() {
    const auto n = static_cast<int>(config_.fft_size);

    fftw_->input = fftwf_alloc_real(config_.fft_size);
    fftw_->output = fftwf_alloc_complex(bin_count());

    if (fftw_->input == nullptr || fftw_->output == nullptr) {
        throw std::runtime_error("Failed to allocate FFTW buffers");
    }

    {
        // FFTW_ESTIMATE: fast startup, plan does not touch the buffers
        std::lock_guard<std::mutex> lock{g_planner_mutex};
        fftw_->plan = fftwf_plan_dft_r2c_1d(n, fftw_->input, fftw_->output, FFTW_ESTIMATE);
    }

    if (fftw_->plan == nullptr) {
        throw std::runtime_error("Failed to create FFTW plan for size " +
                                 std::to_string(config_.fft_size));
    }

    window_.resize(config_.fft_size);
}

void FFTProcessor::compute_window() {
    const auto n = config_.fft_size;
    constexpr auto pi = std::numbers::pi;

    for (std::size_t i = 0; i < n; ++i) {
        const auto x = static_cast<double>(i) / static_cast<double>(n - 1);
        window_[i] = static_cast<float>(0.5 - 0.5 * std::cos(2.0 * pi * x));
    }
}

void FFTProcessor::compute(std::span<const float> samples, std::span<float> output) {
    const auto n = config_.fft_size;

    if (samples.size() != n) {
        throw std::invalid_argument("FFT input has " + std::to_string(samples.size()) +
                                    " samples, expected " + std::to_string(n));
    }
    if (output.size() < bin_count()) {
        throw std::invalid_argument("FFT output buffer too small");
    }

    for (std::size_t i = 0; i < n; ++i) {
        fftw_->input[i] = samples[i] * window_[i];
    }

    fftwf_execute(fftw_->plan);

    const auto num_bins = bin_count();
    for (std::size_t i = 0; i < num_bins; ++i) {
        const float re = fftw_->output[i][0];
        const float im = fftw_->output[i][1];
        output[i] = std::sqrt(re * re + im * im);
    }
}

}  // namespace bandscope
