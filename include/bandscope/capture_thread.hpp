#pragma once

#include "bandscope/analysis_state.hpp"
#include "bandscope/audio_source.hpp"
#include "bandscope/device_resolver.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <thread>

namespace bandscope {

/// Capture statistics for monitoring.
struct CaptureStats {
    std::uint64_t frames_processed = 0;
    std::uint64_t overflows = 0;       // Transient overflow/underrun reads
    std::uint64_t dropped_frames = 0;  // Frames rejected as anomalies
};

/// Why the capture loop ended.
enum class CaptureExit {
    None,        // Still running, or never started
    Stopped,     // Stop flag observed
    OpenFailed,  // Source could not be opened
    ReadFailed   // Fatal read or processing error
};

/// Background producer: read -> downmix -> analyze -> publish.
///
/// The loop state lives in a shared context owned jointly by this object
/// and the worker, so stop() may give up waiting and detach the worker
/// without leaving it with dangling references. The audio source is
/// created and destroyed on the worker thread.
class CaptureThread {
public:
    CaptureThread(std::shared_ptr<SharedAnalysisState> state,
                  CaptureDevice device,
                  StreamParameters params,
                  AudioSourceFactory factory);

    /// Equivalent to stop() with the default two second bound.
    ~CaptureThread();

    CaptureThread(const CaptureThread&) = delete;
    CaptureThread& operator=(const CaptureThread&) = delete;

    /// Spawns the worker. Idempotent while running.
    void start();

    /// Raises the stop flag and waits up to `timeout` for the worker.
    /// @return true if the worker exited (and was joined), false if it was
    ///         still blocked and has been detached.
    bool stop(std::chrono::milliseconds timeout = std::chrono::milliseconds{2000});

    /// True from start() until the worker leaves its loop.
    [[nodiscard]] bool running() const noexcept;

    /// True while a worker that stop() detached is still alive.
    [[nodiscard]] bool detached() const noexcept;

    [[nodiscard]] CaptureStats stats() const noexcept;
    [[nodiscard]] CaptureExit exit_reason() const noexcept;

private:
    struct Context;

    static void run(std::shared_ptr<Context> ctx);

    std::shared_ptr<Context> context_;
    std::thread thread_;
    std::future<void> finished_;
    bool detached_ = false;
};

}  // namespace bandscope
