#include "bandscope/capture_thread.hpp"

#include "bandscope/logging.hpp"
#include "bandscope/spectral_processor.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <stdexcept>
#include <utility>
#include <vector>

namespace bandscope {

namespace {

// Overflow warnings after the first are logged once per this many.
constexpr std::uint64_t kOverflowLogInterval = 100;

}  // namespace

struct CaptureThread::Context {
    std::shared_ptr<SharedAnalysisState> state;
    CaptureDevice device;
    StreamParameters params;
    AudioSourceFactory factory;

    std::atomic<bool> stop_requested{false};
    std::atomic<bool> active{false};
    std::atomic<CaptureExit> exit_reason{CaptureExit::None};
    std::promise<void> done;

    std::atomic<std::uint64_t> frames_processed{0};
    std::atomic<std::uint64_t> overflows{0};
    std::atomic<std::uint64_t> dropped_frames{0};
};

CaptureThread::CaptureThread(std::shared_ptr<SharedAnalysisState> state, CaptureDevice device,
                             StreamParameters params, AudioSourceFactory factory)
    : context_{std::make_shared<Context>()} {
    context_->state = std::move(state);
    context_->device = std::move(device);
    context_->params = params;
    context_->factory = std::move(factory);
}

CaptureThread::~CaptureThread() {
    stop();
}

void CaptureThread::start() {
    if (thread_.joinable()) {
        return;  // Already running
    }

    // A fresh context per run; a detached earlier worker keeps its own.
    detached_ = false;
    auto next = std::make_shared<Context>();
    next->state = context_->state;
    next->device = context_->device;
    next->params = context_->params;
    next->factory = context_->factory;
    context_ = std::move(next);

    finished_ = context_->done.get_future();
    context_->active.store(true, std::memory_order_release);
    thread_ = std::thread{&CaptureThread::run, context_};
}

bool CaptureThread::stop(std::chrono::milliseconds timeout) {
    if (!thread_.joinable()) {
        return true;  // Not running
    }

    context_->stop_requested.store(true, std::memory_order_release);

    if (finished_.wait_for(timeout) == std::future_status::ready) {
        thread_.join();
        return true;
    }

    logger()->warn("Capture thread did not exit within {} ms; detaching it", timeout.count());
    thread_.detach();
    detached_ = true;
    return false;
}

bool CaptureThread::running() const noexcept {
    return context_->active.load(std::memory_order_acquire);
}

bool CaptureThread::detached() const noexcept {
    return detached_ && running();
}

CaptureStats CaptureThread::stats() const noexcept {
    return CaptureStats{.frames_processed = context_->frames_processed.load(std::memory_order_relaxed),
                        .overflows = context_->overflows.load(std::memory_order_relaxed),
                        .dropped_frames = context_->dropped_frames.load(std::memory_order_relaxed)};
}

CaptureExit CaptureThread::exit_reason() const noexcept {
    return context_->exit_reason.load(std::memory_order_acquire);
}

void CaptureThread::run(std::shared_ptr<Context> ctx) {
    // Declared first so it fires after the source has been released.
    struct Finish {
        Context& ctx;
        ~Finish() {
            ctx.active.store(false, std::memory_order_release);
            ctx.done.set_value();
        }
    } finish{*ctx};

    auto log = logger();
    const auto& params = ctx->params;

    std::unique_ptr<AudioSource> source;
    std::unique_ptr<SpectralProcessor> processor;
    try {
        processor = std::make_unique<SpectralProcessor>(params.frames_per_read, params.sample_rate);
        source = ctx->factory(ctx->device, params);
        if (!source) {
            throw std::runtime_error("no audio source was created");
        }
    } catch (const std::exception& e) {
        log->error("Failed to open capture stream on '{}': {}", ctx->device.name, e.what());
        ctx->exit_reason.store(CaptureExit::OpenFailed, std::memory_order_release);
        return;
    }

    const auto channels = std::max(source->channels(), 1);
    std::vector<float> interleaved(params.frames_per_read * static_cast<std::size_t>(channels));
    std::vector<float> mono(params.frames_per_read);
    std::array<bool, kProcessingAnomalyCount> anomaly_logged{};

    const auto drop_frame = [&](ProcessingAnomaly anomaly) {
        ctx->dropped_frames.fetch_add(1, std::memory_order_relaxed);
        auto& logged = anomaly_logged[static_cast<std::size_t>(anomaly)];
        if (!logged) {
            log->warn("Dropping frame: {}", to_string(anomaly));
            logged = true;
        }
    };

    log->info("Capturing '{}' at {} Hz, {} ch, {} frames per read", ctx->device.name,
              params.sample_rate, channels, params.frames_per_read);

    try {
        while (!ctx->stop_requested.load(std::memory_order_acquire)) {
            const ReadResult result = source->read(interleaved);

            if (ctx->stop_requested.load(std::memory_order_acquire)) {
                break;
            }

            if (result.status == ReadStatus::Overflow) {
                const auto count = ctx->overflows.fetch_add(1, std::memory_order_relaxed) + 1;
                if (count == 1 || count % kOverflowLogInterval == 0) {
                    log->warn("Capture overflow ({} so far): {}", count, result.message);
                }
                continue;
            }
            if (result.status == ReadStatus::Error) {
                log->error("Audio capture error: {}", result.message);
                ctx->exit_reason.store(CaptureExit::ReadFailed, std::memory_order_release);
                return;
            }

            downmix(interleaved, channels, mono);

            if (const auto anomaly = processor->validate(mono)) {
                drop_frame(*anomaly);
                continue;
            }

            if (!ctx->state->update(processor->process(mono))) {
                drop_frame(ProcessingAnomaly::NonFiniteResult);
                continue;
            }
            ctx->frames_processed.fetch_add(1, std::memory_order_relaxed);
        }
    } catch (const std::exception& e) {
        log->error("Audio capture error: {}", e.what());
        ctx->exit_reason.store(CaptureExit::ReadFailed, std::memory_order_release);
        return;
    }

    ctx->exit_reason.store(CaptureExit::Stopped, std::memory_order_release);
}

}  // namespace bandscope
