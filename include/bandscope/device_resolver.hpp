#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bandscope {

/// Sentinel for "no device" in provider records.
inline constexpr int kNoDevice = -1;

/// One host audio API (WASAPI, ALSA, PulseAudio, CoreAudio, ...).
struct HostApiInfo {
    int index = 0;
    std::string name;
    int default_output_device = kNoDevice;  // Global device index
};

/// One device endpoint as reported by a provider.
struct DeviceInfo {
    int index = 0;                 // Global device index
    int host_api = 0;              // HostApiInfo::index
    std::string name;
    int max_input_channels = 0;
    int max_output_channels = 0;
    double default_sample_rate = 0.0;
    bool is_loopback = false;      // Captures what an output renders
};

/// The capture endpoint chosen at startup. Immutable afterwards.
struct CaptureDevice {
    int index = kNoDevice;
    int host_api = 0;
    std::string name;
    int channels = 0;
    double sample_rate = 0.0;
    bool is_loopback = false;
};

/// Platform capability that lists audio APIs and devices.
///
/// Implementations exist per platform mechanism (PortAudio enumeration
/// covering WASAPI loopback, PulseAudio monitors and ALSA loopback cards);
/// tests supply in-memory listings.
class DeviceProvider {
public:
    virtual ~DeviceProvider() = default;

    /// Human readable backend name for diagnostics.
    [[nodiscard]] virtual std::string name() const = 0;

    /// @throws std::runtime_error if the backend cannot be queried.
    [[nodiscard]] virtual std::vector<HostApiInfo> host_apis() const = 0;

    /// @throws std::runtime_error if the backend cannot be queried.
    [[nodiscard]] virtual std::vector<DeviceInfo> devices() const = 0;
};

/// Finds the loopback endpoint paired with the system's active output.
///
/// Policy:
///   1. Take the first host API exposing any loopback-capable device;
///      without one there is nothing to capture (returns nullopt).
///   2. Within that API, pick the first loopback device whose name
///      contains the name of the API's default output device.
///   3. Otherwise pick the first loopback device on any API.
///
/// The name pairing in step 2 is a substring heuristic and misses devices
/// whose input and output names diverge; step 3 then takes over.
class DeviceResolver {
public:
    explicit DeviceResolver(const DeviceProvider& provider) : provider_{provider} {}

    /// Never throws; provider failures are logged and yield nullopt.
    [[nodiscard]] std::optional<CaptureDevice> resolve() const noexcept;

private:
    const DeviceProvider& provider_;
};

/// Returns true if a device name carries a known loopback marker:
/// "[Loopback]" (WASAPI loopback endpoints), "Monitor of" / ".monitor"
/// (PulseAudio monitor sources) or "Loopback" (ALSA snd-aloop).
[[nodiscard]] bool looks_like_loopback(std::string_view device_name) noexcept;

}  // namespace bandscope
