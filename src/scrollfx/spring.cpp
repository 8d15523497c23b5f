// filename: spring.cpp
// part of Scroll-Driven Background Animation Engine
// MIT License

#include "scrollfx/spring.hpp"

#include "scrollfx/types.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace scrollfx {

void validateSpringConfig(const SpringConfig& config) {
    if (!(config.stiffness > 0.0) || !std::isfinite(config.stiffness)) {
        throw ConfigurationError("spring.stiffness must be positive");
    }
    if (!(config.damping >= 0.0) || !std::isfinite(config.damping)) {
        throw ConfigurationError("spring.damping must be non-negative");
    }
    if (!(config.mass > 0.0) || !std::isfinite(config.mass)) {
        throw ConfigurationError("spring.mass must be positive");
    }
}

double dampingRatio(const SpringConfig& config) {
    return config.damping / (2.0 * std::sqrt(config.stiffness * config.mass));
}

double springEase(double fraction, const SpringConfig& config) {
    const double f = std::clamp(fraction, 0.0, 1.0);
    const double omega = std::sqrt(config.stiffness / config.mass);
    const double zeta = dampingRatio(config);

    if (zeta >= 1.0) {
        return f;
    }

    const double root = std::sqrt(1.0 - zeta * zeta);
    const double envelope = std::exp(-zeta * omega * f);
    const double theta = omega * root * f;
    return 1.0 - envelope * (std::cos(theta) + (zeta / root) * std::sin(theta));
}

PositionSpringModel::PositionSpringModel(const SpringConfig& config, double stepFraction,
                                         PositionMapping mapping)
    : config_(config), stepFraction_(stepFraction), mapping_(mapping) {
    validateSpringConfig(config_);
    if (!(stepFraction_ > 0.0) || stepFraction_ > 1.0) {
        throw ConfigurationError("spring.stepFraction must lie in (0, 1]");
    }
    if (!std::isfinite(mapping_.base) || !std::isfinite(mapping_.range)) {
        throw ConfigurationError("position.base and position.range must be finite");
    }
    eased_ = springEase(stepFraction_, config_);
    current_ = mapping_.base;
    target_ = mapping_.base;
}

void PositionSpringModel::setTarget(double value) {
    if (!std::isfinite(value)) {
        return;
    }
    target_ = value;
}

void PositionSpringModel::setTargetFromProgress(double progress) {
    target_ = mapping_.base - sanitizeProgress(progress) * mapping_.range;
}

double PositionSpringModel::tick(double dtSeconds) {
    (void)dtSeconds;
    current_ += eased_ * (target_ - current_);
    return current_;
}

double PositionSpringModel::contractionPerTick() const {
    return std::abs(1.0 - eased_);
}

std::size_t PositionSpringModel::ticksToConverge(double relativeTolerance) const {
    const double factor = contractionPerTick();
    if (!(relativeTolerance > 0.0) || relativeTolerance >= 1.0) {
        return 0;
    }
    if (factor == 0.0) {
        return 1;
    }
    if (factor >= 1.0) {
        return 0;
    }
    return static_cast<std::size_t>(std::ceil(std::log(relativeTolerance) / std::log(factor)));
}

}  // namespace scrollfx
