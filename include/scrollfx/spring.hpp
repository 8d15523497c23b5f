// filename: spring.hpp
// part of Scroll-Driven Background Animation Engine
// MIT License

#pragma once

#include <cstddef>

namespace scrollfx {

struct SpringConfig {
    double stiffness{0.02};
    double damping{0.35};
    double mass{1.0};
};

/// Ticks after which the reference configuration is within 1% of a new target.
constexpr std::size_t kReferenceConvergenceTicks = 30;

/**
 * @throws ConfigurationError for stiffness <= 0, damping < 0 or mass <= 0.
 */
void validateSpringConfig(const SpringConfig& config);

[[nodiscard]] double dampingRatio(const SpringConfig& config);

/**
 * @brief Step response of a damped harmonic oscillator at @p fraction in [0, 1].
 *
 * Underdamped configurations overshoot 1. Critically and overdamped
 * configurations fall back to the linear response, eased == fraction.
 */
[[nodiscard]] double springEase(double fraction, const SpringConfig& config);

/// Linear progress-to-offset mapping: target = base - progress * range.
struct PositionMapping {
    double base{0.8};
    double range{0.6};
};

/**
 * @brief Smooths one scalar (the vertical background offset) toward a progress-driven target.
 *
 * Every tick covers the same fraction of the spring response, independent of
 * wall time, so the remaining distance shrinks by a constant factor
 * |1 - springEase(stepFraction)| per tick. The elapsed time handed to tick()
 * does not change the step.
 */
class PositionSpringModel {
public:
    PositionSpringModel() : PositionSpringModel(SpringConfig{}, 0.8, PositionMapping{}) {}

    /**
     * @throws ConfigurationError for an invalid spring or a step fraction outside (0, 1].
     */
    PositionSpringModel(const SpringConfig& config, double stepFraction, PositionMapping mapping);

    void setTarget(double value);

    // target = base - progress * range
    void setTargetFromProgress(double progress);

    double tick(double dtSeconds = 0.0);

    [[nodiscard]] double current() const { return current_; }
    [[nodiscard]] double target() const { return target_; }
    [[nodiscard]] double stepFraction() const { return stepFraction_; }
    [[nodiscard]] const SpringConfig& config() const { return config_; }

    /// Remaining-distance factor applied by each tick.
    [[nodiscard]] double contractionPerTick() const;

    /**
     * @brief Ticks needed to close all but @p relativeTolerance of the current gap.
     * @return 0 if the spring never contracts (undamped oscillation).
     */
    [[nodiscard]] std::size_t ticksToConverge(double relativeTolerance) const;

private:
    SpringConfig config_{};
    double stepFraction_{0.8};
    PositionMapping mapping_{};
    double eased_{0.8};
    double current_{0.8};
    double target_{0.8};
};

}  // namespace scrollfx
