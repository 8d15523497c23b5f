// filename: frame_clock.cpp
// part of Scroll-Driven Background Animation Engine
// MIT License

#include "scrollfx/frame_clock.hpp"

#include "scrollfx/types.hpp"

#include <algorithm>
#include <cmath>
#include <thread>
#include <utility>
#include <vector>

namespace scrollfx {

namespace {

// Slack for frame timestamps that land a hair before the capped interval.
constexpr double kCapToleranceMs = 0.5;

// Dispatch the callbacks whose ids were pending when the batch started.
// Ids cancelled by an earlier callback of the same batch are skipped.
std::size_t dispatchBatch(std::map<FrameId, FrameCallback>& pending, double timestampMs) {
    std::vector<FrameId> batch;
    batch.reserve(pending.size());
    for (const auto& entry : pending) {
        batch.push_back(entry.first);
    }

    std::size_t fired = 0;
    for (FrameId id : batch) {
        auto it = pending.find(id);
        if (it == pending.end()) {
            continue;
        }
        FrameCallback callback = std::move(it->second);
        pending.erase(it);
        callback(timestampMs);
        ++fired;
    }
    return fired;
}

}  // namespace

FrameId ManualFrameScheduler::requestFrame(FrameCallback callback) {
    const FrameId id = nextId_++;
    pending_.emplace(id, std::move(callback));
    return id;
}

void ManualFrameScheduler::cancelFrame(FrameId id) {
    pending_.erase(id);
}

std::size_t ManualFrameScheduler::advanceTo(double timestampMs) {
    nowMs_ = std::max(nowMs_, timestampMs);
    return dispatchBatch(pending_, nowMs_);
}

SteadyFrameScheduler::SteadyFrameScheduler(double refreshHz)
    : period_(1.0 / (refreshHz > 0.0 ? refreshHz : 60.0)),
      origin_(std::chrono::steady_clock::now()) {}

FrameId SteadyFrameScheduler::requestFrame(FrameCallback callback) {
    const FrameId id = nextId_++;
    pending_.emplace(id, std::move(callback));
    return id;
}

void SteadyFrameScheduler::cancelFrame(FrameId id) {
    pending_.erase(id);
}

double SteadyFrameScheduler::elapsedMs() const {
    const std::chrono::duration<double, std::milli> elapsed =
        std::chrono::steady_clock::now() - origin_;
    return elapsed.count();
}

void SteadyFrameScheduler::runFor(std::chrono::duration<double> duration) {
    const auto start = std::chrono::steady_clock::now();
    const auto deadline = start + std::chrono::duration_cast<std::chrono::steady_clock::duration>(duration);
    auto nextFrame = start;

    while (!pending_.empty()) {
        nextFrame += std::chrono::duration_cast<std::chrono::steady_clock::duration>(period_);
        if (nextFrame > deadline) {
            break;
        }
        std::this_thread::sleep_until(nextFrame);
        dispatchBatch(pending_, elapsedMs());
    }
}

void validateFrameClockOptions(const FrameClockOptions& options) {
    if (!(options.maxDeltaSeconds >= 0.0)) {
        throw ConfigurationError("clock.maxDeltaSeconds must be non-negative (0 disables the clamp)");
    }
    if (!(options.frameRateCap >= 0.0) || !std::isfinite(options.frameRateCap)) {
        throw ConfigurationError("clock.frameRateCap must be non-negative");
    }
}

FrameClock::FrameClock(FrameScheduler& scheduler, TickHandler handler, FrameClockOptions options)
    : scheduler_(scheduler), handler_(std::move(handler)), options_(options) {
    validateFrameClockOptions(options_);
}

FrameClock::~FrameClock() {
    stop();
}

void FrameClock::start() {
    if (running_) {
        throw EngineStateError("FrameClock: loop is already running");
    }
    running_ = true;
    hasLast_ = false;
    ticksSinceFpsUpdate_ = 0;
    schedule();
}

void FrameClock::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    if (pendingId_ != 0) {
        scheduler_.cancelFrame(pendingId_);
        pendingId_ = 0;
    }
}

void FrameClock::schedule() {
    pendingId_ = scheduler_.requestFrame([this](double timestampMs) { onFrame(timestampMs); });
}

void FrameClock::onFrame(double timestampMs) {
    pendingId_ = 0;
    if (!running_) {
        return;
    }
    if (!std::isfinite(timestampMs)) {
        schedule();
        return;
    }

    double dt = 0.0;
    if (hasLast_) {
        const double elapsedMs = timestampMs - lastTimestampMs_;
        if (options_.frameRateCap > 0.0 && elapsedMs + kCapToleranceMs < 1000.0 / options_.frameRateCap) {
            schedule();
            return;
        }
        dt = std::max(elapsedMs / 1000.0, 0.0);
        if (options_.maxDeltaSeconds > 0.0 && std::isfinite(options_.maxDeltaSeconds)) {
            dt = std::min(dt, options_.maxDeltaSeconds);
        }
    } else {
        lastFpsUpdateMs_ = timestampMs;
    }
    hasLast_ = true;
    lastTimestampMs_ = timestampMs;

    ++ticks_;
    ++ticksSinceFpsUpdate_;
    const double sinceFpsUpdate = timestampMs - lastFpsUpdateMs_;
    if (sinceFpsUpdate >= 1000.0) {
        measuredFps_ = static_cast<double>(ticksSinceFpsUpdate_) * 1000.0 / sinceFpsUpdate;
        ticksSinceFpsUpdate_ = 0;
        lastFpsUpdateMs_ = timestampMs;
    }

    handler_(dt, timestampMs);

    // The handler may have stopped the clock.
    if (running_) {
        schedule();
    }
}

}  // namespace scrollfx
