#include "bandscope/audio_analyzer.hpp"

#include "bandscope/logging.hpp"
#include "bandscope/portaudio_backend.hpp"

#include <cmath>
#include <exception>
#include <stdexcept>
#include <utility>

namespace bandscope {

std::string_view to_string(AnalyzerStatus status) noexcept {
    switch (status) {
        case AnalyzerStatus::Idle:
            return "idle";
        case AnalyzerStatus::Degraded:
            return "degraded";
        case AnalyzerStatus::Running:
            return "running";
        case AnalyzerStatus::Stopped:
            return "stopped";
        case AnalyzerStatus::Failed:
            return "failed";
    }
    return "unknown";
}

AnalyzerConfig AudioAnalyzer::validated(const AnalyzerConfig& config) {
    if (config.buffer_size < 2) {
        throw std::invalid_argument("Buffer size must be at least 2 frames");
    }
    if (config.sample_rate_override && *config.sample_rate_override == 0) {
        throw std::invalid_argument("Sample rate override must be positive");
    }
    if (config.stop_timeout.count() < 0) {
        throw std::invalid_argument("Stop timeout must not be negative");
    }
    return config;
}

AudioAnalyzer::AudioAnalyzer(const AnalyzerConfig& config)
    : AudioAnalyzer(config, PortAudioDeviceProvider{}, &PortAudioSource::open) {}

AudioAnalyzer::AudioAnalyzer(const AnalyzerConfig& config, const DeviceProvider& provider,
                             AudioSourceFactory factory)
    : config_{validated(config)},
      state_{std::make_shared<SharedAnalysisState>(config_.band_smoothing,
                                                   config_.spectrum_smoothing)},
      device_{DeviceResolver{provider}.resolve()},
      factory_{std::move(factory)} {
    if (config_.sample_rate_override) {
        sample_rate_ = static_cast<double>(*config_.sample_rate_override);
    } else if (device_ && device_->sample_rate > 0.0) {
        sample_rate_ = std::round(device_->sample_rate);
    } else {
        sample_rate_ = kFallbackSampleRate;
    }
}

AudioAnalyzer::~AudioAnalyzer() {
    stop();
}

void AudioAnalyzer::start() noexcept {
    std::lock_guard<std::mutex> lock{lifecycle_mutex_};

    if (capture_ && capture_->running()) {
        return;
    }

    if (!device_) {
        if (!degraded_warned_) {
            logger()->warn("No loopback device found; audio levels will stay at zero");
            degraded_warned_ = true;
        }
        status_ = AnalyzerStatus::Degraded;
        return;
    }

    try {
        // Replacing a finished thread joins it (it has already exited).
        capture_.reset();
        capture_ = std::make_unique<CaptureThread>(
            state_, *device_,
            StreamParameters{.channels = device_->channels,
                             .sample_rate = sample_rate_,
                             .frames_per_read = config_.buffer_size},
            factory_);
        capture_->start();
        status_ = AnalyzerStatus::Running;
    } catch (const std::exception& e) {
        logger()->error("Failed to start capture thread: {}", e.what());
        capture_.reset();
        status_ = AnalyzerStatus::Failed;
    }
}

void AudioAnalyzer::stop() noexcept {
    std::lock_guard<std::mutex> lock{lifecycle_mutex_};

    if (!capture_) {
        return;
    }

    const bool joined = capture_->stop(config_.stop_timeout);
    const auto reason = capture_->exit_reason();
    if (status_ == AnalyzerStatus::Running) {
        const bool failed = joined && (reason == CaptureExit::OpenFailed ||
                                       reason == CaptureExit::ReadFailed);
        status_ = failed ? AnalyzerStatus::Failed : AnalyzerStatus::Stopped;
    }
}

AnalyzerStatus AudioAnalyzer::status() const noexcept {
    std::lock_guard<std::mutex> lock{lifecycle_mutex_};

    if (status_ == AnalyzerStatus::Running && capture_ && !capture_->running()) {
        const auto reason = capture_->exit_reason();
        if (reason == CaptureExit::OpenFailed || reason == CaptureExit::ReadFailed) {
            return AnalyzerStatus::Failed;
        }
        return AnalyzerStatus::Stopped;
    }
    return status_;
}

CaptureStats AudioAnalyzer::stats() const noexcept {
    std::lock_guard<std::mutex> lock{lifecycle_mutex_};
    return capture_ ? capture_->stats() : CaptureStats{};
}

bool AudioAnalyzer::has_detached_worker() const noexcept {
    std::lock_guard<std::mutex> lock{lifecycle_mutex_};
    return capture_ && capture_->detached();
}

}  // namespace bandscope
