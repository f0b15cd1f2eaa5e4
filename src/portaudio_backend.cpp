#include "bandscope/portaudio_backend.hpp"

#include "bandscope/logging.hpp"

#include <portaudio.h>

#include <stdexcept>
#include <string>

namespace bandscope {

std::mutex PortAudioGuard::mutex_;
int PortAudioGuard::ref_count_ = 0;

PortAudioGuard::PortAudioGuard() {
    std::lock_guard<std::mutex> lock{mutex_};
    if (ref_count_ == 0) {
        PaError err = Pa_Initialize();
        if (err != paNoError) {
            throw std::runtime_error(std::string("Failed to initialize PortAudio: ") +
                                     Pa_GetErrorText(err));
        }
    }
    ++ref_count_;
}

PortAudioGuard::~PortAudioGuard() {
    std::lock_guard<std::mutex> lock{mutex_};
    if (--ref_count_ == 0) {
        Pa_Terminate();
    }
}

void PortAudioDeviceProvider::open_session() const {
    if (!session_) {
        session_.emplace();
    }
}

std::vector<HostApiInfo> PortAudioDeviceProvider::host_apis() const {
    open_session();

    const PaHostApiIndex count = Pa_GetHostApiCount();
    if (count < 0) {
        throw std::runtime_error(std::string("Failed to enumerate host APIs: ") +
                                 Pa_GetErrorText(count));
    }

    std::vector<HostApiInfo> apis;
    apis.reserve(static_cast<std::size_t>(count));
    for (PaHostApiIndex i = 0; i < count; ++i) {
        const PaHostApiInfo* info = Pa_GetHostApiInfo(i);
        if (info == nullptr) {
            continue;
        }
        apis.push_back(HostApiInfo{.index = i,
                                   .name = info->name,
                                   .default_output_device = info->defaultOutputDevice == paNoDevice
                                                                ? kNoDevice
                                                                : info->defaultOutputDevice});
    }
    return apis;
}

std::vector<DeviceInfo> PortAudioDeviceProvider::devices() const {
    open_session();

    const PaDeviceIndex count = Pa_GetDeviceCount();
    if (count < 0) {
        throw std::runtime_error(std::string("Failed to enumerate audio devices: ") +
                                 Pa_GetErrorText(count));
    }

    std::vector<DeviceInfo> devices;
    devices.reserve(static_cast<std::size_t>(count));
    for (PaDeviceIndex i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info == nullptr) {
            continue;
        }
        devices.push_back(DeviceInfo{
            .index = i,
            .host_api = info->hostApi,
            .name = info->name,
            .max_input_channels = info->maxInputChannels,
            .max_output_channels = info->maxOutputChannels,
            .default_sample_rate = info->defaultSampleRate,
            .is_loopback = info->maxInputChannels > 0 && looks_like_loopback(info->name)});
    }
    return devices;
}

void PortAudioSource::StreamCloser::operator()(void* stream) const noexcept {
    auto* pa_stream = static_cast<PaStream*>(stream);
    if (Pa_IsStreamActive(pa_stream) == 1) {
        Pa_StopStream(pa_stream);
    }
    PaError err = Pa_CloseStream(pa_stream);
    if (err != paNoError) {
        logger()->warn("Failed to close capture stream: {}", Pa_GetErrorText(err));
    }
}

PortAudioSource::PortAudioSource(const CaptureDevice& device, const StreamParameters& params)
    : params_{params} {
    // The index came from an earlier PortAudio session; make sure it still
    // names the same device.
    const PaDeviceInfo* device_info = Pa_GetDeviceInfo(device.index);
    if (device_info == nullptr || device.name != device_info->name) {
        throw std::runtime_error("Capture device " + std::to_string(device.index) + " ('" +
                                 device.name + "') is no longer available");
    }

    PaStreamParameters input_params{};
    input_params.device = device.index;
    input_params.channelCount = params_.channels;
    input_params.sampleFormat = paFloat32;
    input_params.suggestedLatency = device_info->defaultHighInputLatency;
    input_params.hostApiSpecificStreamInfo = nullptr;

    // No callback: the stream is read with Pa_ReadStream.
    PaStream* raw = nullptr;
    PaError err = Pa_OpenStream(&raw, &input_params,
                                nullptr,  // No output
                                params_.sample_rate,
                                static_cast<unsigned long>(params_.frames_per_read), paClipOff,
                                nullptr, nullptr);
    if (err != paNoError) {
        throw std::runtime_error(std::string("Failed to open audio stream: ") +
                                 Pa_GetErrorText(err));
    }
    stream_.reset(raw);

    err = Pa_StartStream(raw);
    if (err != paNoError) {
        throw std::runtime_error(std::string("Failed to start audio stream: ") +
                                 Pa_GetErrorText(err));
    }
}

PortAudioSource::~PortAudioSource() = default;

ReadResult PortAudioSource::read(std::span<float> interleaved) {
    const auto frames = interleaved.size() / static_cast<std::size_t>(params_.channels);
    PaError err = Pa_ReadStream(stream_.get(), interleaved.data(), static_cast<unsigned long>(frames));

    if (err == paNoError) {
        return {};
    }
    if (err == paInputOverflowed || err == paOutputUnderflowed) {
        return ReadResult{.status = ReadStatus::Overflow, .message = Pa_GetErrorText(err)};
    }
    return ReadResult{.status = ReadStatus::Error, .message = Pa_GetErrorText(err)};
}

std::unique_ptr<AudioSource> PortAudioSource::open(const CaptureDevice& device,
                                                   const StreamParameters& params) {
    return std::make_unique<PortAudioSource>(device, params);
}

}  // namespace bandscope
