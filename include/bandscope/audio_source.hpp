#pragma once

#include "bandscope/device_resolver.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <string>

namespace bandscope {

/// Parameters for opening a capture stream.
struct StreamParameters {
    int channels = 2;
    double sample_rate = 44100.0;
    std::size_t frames_per_read = 2048;
};

enum class ReadStatus {
    Ok,        // Buffer filled
    Overflow,  // Input overflowed/underran; transient, keep reading
    Error      // Stream is unusable
};

struct ReadResult {
    ReadStatus status = ReadStatus::Ok;
    std::string message;  // Backend description for Overflow/Error
};

/// A blocking source of interleaved float samples.
///
/// Owned exclusively by the capture thread; the destructor releases every
/// backend handle the source acquired.
class AudioSource {
public:
    virtual ~AudioSource() = default;

    /// Blocks until `interleaved` (frames_per_read * channels samples) is
    /// filled or the stream reports a condition.
    [[nodiscard]] virtual ReadResult read(std::span<float> interleaved) = 0;

    [[nodiscard]] virtual int channels() const noexcept = 0;
};

/// Opens a source for a resolved device.
/// @throws std::runtime_error when the stream cannot be opened.
using AudioSourceFactory =
    std::function<std::unique_ptr<AudioSource>(const CaptureDevice&, const StreamParameters&)>;

}  // namespace bandscope
