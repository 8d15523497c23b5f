// filename: engine.hpp
// part of Scroll-Driven Background Animation Engine
// MIT License

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <utility>
#include <variant>
#include <vector>

#include "scrollfx/frame_clock.hpp"
#include "scrollfx/progress.hpp"
#include "scrollfx/rotation.hpp"
#include "scrollfx/spring.hpp"
#include "scrollfx/types.hpp"

namespace scrollfx {

struct EngineConfig {
    std::vector<ColorPair> colorStops;
    int entityCount{12};
    SpringConfig spring{};
    double springStepFraction{0.8};
    PositionMapping position{};
    double xOffset{0.5};
    SpeedConfig speed{};
    FrameClockOptions clock{};
    std::optional<std::uint32_t> seed;
};

/// Green and violet stops used by the site background.
[[nodiscard]] std::vector<ColorPair> defaultColorStops();

[[nodiscard]] EngineConfig defaultEngineConfig();

/**
 * @throws ConfigurationError describing the first invalid field.
 */
void validateEngineConfig(const EngineConfig& config);

/// One angle per entity, or a bare angle when the engine drives a single entity.
using Rotations = std::variant<double, std::vector<double>>;

struct EngineSnapshot {
    std::uint64_t frameIndex{0};
    double timestampMs{0.0};
    double progress{0.0};
    ColorPair colorPair{};
    Rotations rotations{0.0};
    double yOffset{0.0};
    double xOffset{0.0};

    [[nodiscard]] std::size_t rotationCount() const;
    [[nodiscard]] double rotation(std::size_t index) const;
};

/**
 * @brief Scroll-driven background animation engine.
 *
 * Progress pushes are only recorded; targets, direction and entity state
 * change inside tick(). Each tick publishes a new immutable snapshot.
 * stop() is terminal: the engine ignores ticks and progress afterwards and
 * cannot be started again.
 *
 * The scheduler and any attached ProgressSignal must outlive the engine.
 */
class Engine {
public:
    using SnapshotPtr = std::shared_ptr<const EngineSnapshot>;
    using SnapshotListener = std::function<void(const EngineSnapshot&)>;
    using ListenerId = std::uint64_t;

    /**
     * @throws ConfigurationError if @p config is invalid.
     */
    Engine(EngineConfig config, FrameScheduler& scheduler);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /**
     * @throws EngineStateError when already running or after stop().
     */
    void start();

    void stop();

    [[nodiscard]] bool running() const { return clock_.running(); }
    [[nodiscard]] bool stopped() const { return stopped_; }

    void pushProgress(double value);

    /// Follow @p signal, replacing any previous source. Physical state is kept.
    void attach(ProgressSignal& signal);
    void detach();
    [[nodiscard]] bool attached() const { return subscription_.active(); }

    /**
     * @brief Advance one frame. Driven by the frame clock; hosts may also call it directly.
     */
    void tick(double dtSeconds, double timestampMs);

    [[nodiscard]] SnapshotPtr snapshot() const { return snapshot_; }

    ListenerId subscribe(SnapshotListener listener);
    void unsubscribe(ListenerId id);

    [[nodiscard]] const EngineConfig& config() const { return config_; }
    [[nodiscard]] const RotationFieldSimulator& rotation() const { return rotation_; }
    [[nodiscard]] const PositionSpringModel& spring() const { return spring_; }
    [[nodiscard]] const FrameClock& clock() const { return clock_; }

private:
    struct PendingProgress {
        double previous{0.0};
        double latest{0.0};
        bool dirty{false};
        bool seen{false};
    };

    void applyPendingProgress();
    void publish(double timestampMs);

    EngineConfig config_;
    std::mt19937 rng_;
    PositionSpringModel spring_;
    RotationFieldSimulator rotation_;
    FrameClock clock_;
    ProgressSignal::Subscription subscription_;

    PendingProgress pending_{};
    double progress_{0.0};
    std::uint64_t frameIndex_{0};
    bool stopped_{false};
    bool warnedNonFinite_{false};

    SnapshotPtr snapshot_;
    std::vector<std::pair<ListenerId, SnapshotListener>> listeners_;
    ListenerId nextListenerId_{1};
};

}  // namespace scrollfx
