// filename: frame_clock.hpp
// part of Scroll-Driven Background Animation Engine
// MIT License

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>

namespace scrollfx {

using FrameId = std::uint64_t;
using FrameCallback = std::function<void(double timestampMs)>;

/**
 * @brief Host "run this before the next repaint" primitive.
 *
 * A requested callback fires once. Cancelling guarantees it will not fire,
 * even when the host is already dispatching the same frame.
 */
struct FrameScheduler {
    virtual ~FrameScheduler() = default;
    virtual FrameId requestFrame(FrameCallback callback) = 0;
    virtual void cancelFrame(FrameId id) = 0;
};

/**
 * @brief Scheduler driven explicitly by the caller with synthetic timestamps.
 */
class ManualFrameScheduler : public FrameScheduler {
public:
    FrameId requestFrame(FrameCallback callback) override;
    void cancelFrame(FrameId id) override;

    /**
     * @brief Fire every callback requested before this call with @p timestampMs.
     * @return number of callbacks dispatched.
     */
    std::size_t advanceTo(double timestampMs);

    std::size_t step(double deltaMs) { return advanceTo(nowMs_ + deltaMs); }

    [[nodiscard]] std::size_t pending() const { return pending_.size(); }
    [[nodiscard]] double now() const { return nowMs_; }

private:
    std::map<FrameId, FrameCallback> pending_;
    FrameId nextId_{1};
    double nowMs_{0.0};
};

/**
 * @brief Cooperative display loop on the calling thread, paced by steady_clock.
 */
class SteadyFrameScheduler : public FrameScheduler {
public:
    explicit SteadyFrameScheduler(double refreshHz = 60.0);

    FrameId requestFrame(FrameCallback callback) override;
    void cancelFrame(FrameId id) override;

    /// Dispatch frames until @p duration elapses or nothing is pending.
    void runFor(std::chrono::duration<double> duration);

    [[nodiscard]] std::size_t pending() const { return pending_.size(); }

private:
    [[nodiscard]] double elapsedMs() const;

    std::map<FrameId, FrameCallback> pending_;
    FrameId nextId_{1};
    std::chrono::duration<double> period_;
    std::chrono::steady_clock::time_point origin_;
};

struct FrameClockOptions {
    double maxDeltaSeconds{0.0};  // 0 or +inf = no upper clamp
    double frameRateCap{0.0};     // 0 = host cadence
};

/**
 * @throws ConfigurationError for a negative or NaN maxDeltaSeconds, or a
 *         negative or non-finite frameRateCap.
 */
void validateFrameClockOptions(const FrameClockOptions& options);

/**
 * @brief Turns scheduler callbacks into (dt, timestamp) ticks.
 *
 * The first frame after start() reports dt = 0. Negative deltas read as 0;
 * with a positive finite maxDeltaSeconds, longer deltas are clamped to it.
 * With a frame-rate cap, frames arriving sooner than
 * 1000 / cap ms after the previous tick are re-requested without ticking.
 */
class FrameClock {
public:
    using TickHandler = std::function<void(double dtSeconds, double timestampMs)>;

    FrameClock(FrameScheduler& scheduler, TickHandler handler, FrameClockOptions options = {});
    ~FrameClock();

    FrameClock(const FrameClock&) = delete;
    FrameClock& operator=(const FrameClock&) = delete;

    /**
     * @throws EngineStateError if the clock is already running.
     */
    void start();

    /// Cancel the pending frame. Safe to call repeatedly.
    void stop();

    [[nodiscard]] bool running() const { return running_; }
    [[nodiscard]] std::uint64_t ticks() const { return ticks_; }
    [[nodiscard]] double measuredFps() const { return measuredFps_; }
    [[nodiscard]] const FrameClockOptions& options() const { return options_; }

private:
    void schedule();
    void onFrame(double timestampMs);

    FrameScheduler& scheduler_;
    TickHandler handler_;
    FrameClockOptions options_;
    FrameId pendingId_{0};
    bool running_{false};
    bool hasLast_{false};
    double lastTimestampMs_{0.0};
    std::uint64_t ticks_{0};
    std::uint64_t ticksSinceFpsUpdate_{0};
    double lastFpsUpdateMs_{0.0};
    double measuredFps_{0.0};
};

}  // namespace scrollfx
