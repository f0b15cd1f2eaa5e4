#pragma once

#include "bandscope/analysis_state.hpp"
#include "bandscope/audio_source.hpp"
#include "bandscope/capture_thread.hpp"
#include "bandscope/constants.hpp"
#include "bandscope/device_resolver.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

namespace bandscope {

/// Construction-time tunables.
struct AnalyzerConfig {
    std::optional<std::uint32_t> sample_rate_override;   // Else device rate, else 44100
    std::size_t buffer_size = kDefaultBufferSize;        // Frames per read and FFT size
    float band_smoothing = kDefaultBandSmoothing;        // EMA weight of previous band value
    float spectrum_smoothing = kDefaultSpectrumSmoothing;
    std::chrono::milliseconds stop_timeout{2000};        // Bound on stop()
};

enum class AnalyzerStatus {
    Idle,      // Constructed, not started
    Degraded,  // No loopback device; publishing the zero default
    Running,   // Capture thread active
    Stopped,   // stop() called or thread ended normally
    Failed     // Capture thread ended on an open/read error
};

[[nodiscard]] std::string_view to_string(AnalyzerStatus status) noexcept;

/// System-output loudness analyzer.
///
/// Resolves a loopback capture device once at construction, runs the
/// capture thread between start() and stop(), and serves the smoothed band
/// levels and spectrum to any number of reader threads.
///
/// Failures never cross this interface: without a device the accessors keep
/// returning zeros, and a failing stream simply stops updating them.
///
/// Usage:
///   AudioAnalyzer analyzer;
///   analyzer.start();
///   while (rendering) {
///       const auto levels = analyzer.get_levels();
///       const auto spectrum = analyzer.get_spectrum();
///       draw(levels, spectrum);
///   }
///   analyzer.stop();
class AudioAnalyzer {
public:
    /// Uses PortAudio for device discovery and capture.
    /// @throws std::invalid_argument on an invalid config.
    explicit AudioAnalyzer(const AnalyzerConfig& config = {});

    /// Uses the given provider (only during construction) and source factory.
    /// @throws std::invalid_argument on an invalid config.
    AudioAnalyzer(const AnalyzerConfig& config, const DeviceProvider& provider,
                  AudioSourceFactory factory);

    ~AudioAnalyzer();

    AudioAnalyzer(const AudioAnalyzer&) = delete;
    AudioAnalyzer& operator=(const AudioAnalyzer&) = delete;

    /// Spawns the capture thread, or logs a warning and stays degraded if
    /// no device was resolved. No-op while running.
    void start() noexcept;

    /// Stops capture, waiting at most config().stop_timeout. No-op when
    /// nothing is running.
    void stop() noexcept;

    [[nodiscard]] BandLevels get_levels() const { return state_->get_levels(); }
    [[nodiscard]] Spectrum get_spectrum() const { return state_->get_spectrum(); }

    /// Levels and spectrum from the same update.
    [[nodiscard]] AnalysisFrame snapshot() const { return state_->snapshot(); }

    [[nodiscard]] AnalyzerStatus status() const noexcept;

    /// The resolved device, if any.
    [[nodiscard]] const std::optional<CaptureDevice>& device() const noexcept { return device_; }

    /// Effective sample rate: override, else device default, else 44100.
    [[nodiscard]] double sample_rate() const noexcept { return sample_rate_; }

    [[nodiscard]] CaptureStats stats() const noexcept;

    /// True while a capture worker that stop() gave up on is still blocked
    /// in its read. Such a worker can outlive this object, so a process
    /// that sees this at shutdown should exit without static teardown.
    [[nodiscard]] bool has_detached_worker() const noexcept;

    [[nodiscard]] const AnalyzerConfig& config() const noexcept { return config_; }

private:
    static AnalyzerConfig validated(const AnalyzerConfig& config);

    AnalyzerConfig config_;
    std::shared_ptr<SharedAnalysisState> state_;
    std::optional<CaptureDevice> device_;
    double sample_rate_ = kFallbackSampleRate;
    AudioSourceFactory factory_;

    mutable std::mutex lifecycle_mutex_;
    std::unique_ptr<CaptureThread> capture_;
    AnalyzerStatus status_ = AnalyzerStatus::Idle;
    bool degraded_warned_ = false;
};

}  // namespace bandscope
