#pragma once

#include "bandscope/audio_source.hpp"
#include "bandscope/device_resolver.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bandscope {

/// RAII guard for PortAudio library initialization.
/// Pa_Initialize runs when the first guard is created and Pa_Terminate
/// when the last one is destroyed.
class PortAudioGuard {
public:
    /// @throws std::runtime_error on Pa_Initialize failure.
    PortAudioGuard();
    ~PortAudioGuard();

    PortAudioGuard(const PortAudioGuard&) = delete;
    PortAudioGuard& operator=(const PortAudioGuard&) = delete;

private:
    static std::mutex mutex_;
    static int ref_count_;
};

/// Lists PortAudio host APIs and devices. Loopback capability is derived
/// from device names with looks_like_loopback().
///
/// PortAudio is initialized on the first query and stays initialized until
/// the provider is destroyed, so every index it reports (including
/// HostApiInfo::default_output_device) refers to the same device list.
class PortAudioDeviceProvider final : public DeviceProvider {
public:
    [[nodiscard]] std::string name() const override { return "PortAudio"; }

    /// @throws std::runtime_error if PortAudio fails to initialize.
    [[nodiscard]] std::vector<HostApiInfo> host_apis() const override;
    /// @throws std::runtime_error if PortAudio fails to initialize.
    [[nodiscard]] std::vector<DeviceInfo> devices() const override;

private:
    void open_session() const;

    mutable std::optional<PortAudioGuard> session_;
};

/// Blocking-read PortAudio input stream (no callback).
class PortAudioSource final : public AudioSource {
public:
    /// Opens and starts a paFloat32 input stream on the device.
    /// @throws std::runtime_error on open/start failure.
    PortAudioSource(const CaptureDevice& device, const StreamParameters& params);

    /// Stops and closes the stream.
    ~PortAudioSource() override;

    PortAudioSource(const PortAudioSource&) = delete;
    PortAudioSource& operator=(const PortAudioSource&) = delete;

    [[nodiscard]] ReadResult read(std::span<float> interleaved) override;
    [[nodiscard]] int channels() const noexcept override { return params_.channels; }

    /// Factory usable as an AudioSourceFactory.
    static std::unique_ptr<AudioSource> open(const CaptureDevice& device,
                                             const StreamParameters& params);

private:
    struct StreamCloser {
        void operator()(void* stream) const noexcept;
    };

    PortAudioGuard guard_;
    StreamParameters params_;
    std::unique_ptr<void, StreamCloser> stream_;
};

}  // namespace bandscope
