#include "bandscope/device_resolver.hpp"

#include "bandscope/logging.hpp"

#include <algorithm>
#include <exception>
#include <iterator>

namespace bandscope {

namespace {

CaptureDevice to_capture_device(const DeviceInfo& info) {
    return CaptureDevice{.index = info.index,
                         .host_api = info.host_api,
                         .name = info.name,
                         .channels = info.max_input_channels,
                         .sample_rate = info.default_sample_rate,
                         .is_loopback = info.is_loopback};
}

const DeviceInfo* find_device(const std::vector<DeviceInfo>& devices, int index) {
    const auto it = std::find_if(devices.begin(), devices.end(),
                                 [index](const DeviceInfo& d) { return d.index == index; });
    return it == devices.end() ? nullptr : &*it;
}

std::optional<CaptureDevice> resolve_from(const std::vector<HostApiInfo>& apis,
                                          const std::vector<DeviceInfo>& devices) {
    auto log = logger();

    const auto on_api = [](int api) {
        return [api](const DeviceInfo& d) { return d.host_api == api && d.is_loopback; };
    };

    const auto api_it = std::find_if(apis.begin(), apis.end(), [&](const HostApiInfo& api) {
        return std::any_of(devices.begin(), devices.end(), on_api(api.index));
    });
    if (api_it == apis.end()) {
        log->warn("No host API offers loopback capture");
        return std::nullopt;
    }
    const HostApiInfo& api = *api_it;

    if (const DeviceInfo* output = find_device(devices, api.default_output_device)) {
        log->info("Default output on {}: {}", api.name, output->name);

        for (const auto& dev : devices) {
            if (dev.host_api == api.index && dev.is_loopback &&
                dev.name.find(output->name) != std::string::npos) {
                log->info("Loopback device found: {} ({} ch, {} Hz)", dev.name,
                          dev.max_input_channels, dev.default_sample_rate);
                return to_capture_device(dev);
            }
        }
    } else {
        log->warn("{} reports no default output device", api.name);
    }

    const auto any = std::find_if(devices.begin(), devices.end(),
                                  [](const DeviceInfo& d) { return d.is_loopback; });
    if (any != devices.end()) {
        log->info("Fallback loopback device: {} ({} ch, {} Hz)", any->name,
                  any->max_input_channels, any->default_sample_rate);
        return to_capture_device(*any);
    }

    return std::nullopt;
}

}  // namespace

std::optional<CaptureDevice> DeviceResolver::resolve() const noexcept {
    try {
        return resolve_from(provider_.host_apis(), provider_.devices());
    } catch (const std::exception& e) {
        logger()->error("Error finding loopback device via {}: {}", provider_.name(), e.what());
        return std::nullopt;
    }
}

bool looks_like_loopback(std::string_view device_name) noexcept {
    constexpr std::string_view kMarkers[] = {"[Loopback]", "Monitor of", ".monitor", "Loopback"};
    return std::any_of(std::begin(kMarkers), std::end(kMarkers), [&](std::string_view marker) {
        return device_name.find(marker) != std::string_view::npos;
    });
}

}  // namespace bandscope
