#include "scrollfx/rotation.hpp"

#include "scrollfx/types.hpp"

#include <algorithm>
#include <cmath>

namespace scrollfx {

namespace {

bool finite(double value) {
    return std::isfinite(value);
}

}  // namespace

void validateSpeedConfig(const SpeedConfig& config) {
    if (!finite(config.min) || !finite(config.max) || !finite(config.multiplier) ||
        !finite(config.baseRotationSpeed) || !finite(config.positionExponent) ||
        !finite(config.minRotationSpeed) || !finite(config.dampingConstant)) {
        throw ConfigurationError("speed configuration values must be finite");
    }
    if (config.min < 0.0) {
        throw ConfigurationError("speed.min must be non-negative");
    }
    if (config.max < config.min) {
        throw ConfigurationError("speed.max must not be less than speed.min");
    }
    if (config.minRotationSpeed < 0.0) {
        throw ConfigurationError("speed.minRotationSpeed must be non-negative");
    }
    if (config.dampingConstant < 1.0) {
        throw ConfigurationError("speed.dampingConstant must be at least 1");
    }
}

void RotationFieldSimulator::initialize(std::size_t count, const SpeedConfig& config,
                                        std::mt19937& rng) {
    if (!entities_.empty()) {
        throw EngineStateError("RotationFieldSimulator: entities are already initialized");
    }
    validateSpeedConfig(config);
    config_ = config;
    direction_ = 1.0;

    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::uniform_real_distribution<double> angle(0.0, kFullTurnDeg);
    const double span = config_.max - config_.min;
    const double n = static_cast<double>(count);

    entities_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        EntityState entity{};
        entity.index = i;
        entity.baseSpeed = config_.min + span * ((n - 1.0 - static_cast<double>(i)) / n) +
                           span * unit(rng);
        entity.rotationAngle = wrapDegrees(angle(rng));
        entity.currentSpeed = entity.baseSpeed;
        entity.targetSpeed = cruiseSpeed(entity);
        entities_.push_back(entity);
    }
}

double RotationFieldSimulator::scrollDirection(double previous, double latest) {
    return latest > previous ? -1.0 : 1.0;
}

double RotationFieldSimulator::positionWeight(std::size_t index, std::size_t count) {
    if (count == 0) {
        return 0.0;
    }
    const double n = static_cast<double>(count);
    return (n - static_cast<double>(index)) / n;
}

double RotationFieldSimulator::floored(double magnitude) const {
    return std::max(config_.minRotationSpeed, std::abs(magnitude));
}

double RotationFieldSimulator::cruiseSpeed(const EntityState& entity) const {
    return direction_ * floored(entity.baseSpeed * config_.baseRotationSpeed);
}

double RotationFieldSimulator::scrollSpeed(const EntityState& entity) const {
    const double weight = std::pow(positionWeight(entity.index, entities_.size()),
                                   config_.positionExponent);
    return config_.multiplier * config_.baseRotationSpeed * weight * entity.baseSpeed * direction_;
}

void RotationFieldSimulator::onProgressChange(double previous, double latest) {
    if (entities_.empty()) {
        return;
    }
    direction_ = scrollDirection(sanitizeProgress(previous), sanitizeProgress(latest));

    for (auto& entity : entities_) {
        const double raw = scrollSpeed(entity);
        if (config_.response == SpeedResponse::Impulse) {
            entity.currentSpeed = raw;
            entity.targetSpeed = cruiseSpeed(entity);
        } else {
            entity.targetSpeed = direction_ * floored(raw);
        }
    }
}

double RotationFieldSimulator::interpolationFactor(double dtSeconds) const {
    if (!(dtSeconds > 0.0) || !std::isfinite(dtSeconds)) {
        return 0.0;
    }
    return 1.0 - std::pow(1.0 - 1.0 / config_.dampingConstant, dtSeconds);
}

void RotationFieldSimulator::tick(double dtSeconds) {
    if (entities_.empty()) {
        return;
    }
    const double dt = (dtSeconds > 0.0 && std::isfinite(dtSeconds)) ? dtSeconds : 0.0;
    const double factor = interpolationFactor(dt);

    for (auto& entity : entities_) {
        entity.currentSpeed += (entity.targetSpeed - entity.currentSpeed) * factor;
        entity.rotationAngle = wrapDegrees(entity.rotationAngle + entity.currentSpeed * dt);
    }
}

std::vector<double> RotationFieldSimulator::rotations() const {
    std::vector<double> out;
    out.reserve(entities_.size());
    for (const auto& entity : entities_) {
        out.push_back(entity.rotationAngle);
    }
    return out;
}

std::size_t RotationFieldSimulator::ticksToConverge(double gap, double epsilon, double dtSeconds,
                                                    double dampingConstant) {
    const double absGap = std::abs(gap);
    if (!(epsilon > 0.0) || absGap <= epsilon) {
        return 0;
    }
    if (!(dtSeconds > 0.0) || dampingConstant < 1.0) {
        return 0;
    }
    const double residual = std::pow(1.0 - 1.0 / dampingConstant, dtSeconds);
    if (residual <= 0.0) {
        return 1;
    }
    if (residual >= 1.0) {
        return 0;
    }
    return static_cast<std::size_t>(std::ceil(std::log(epsilon / absGap) / std::log(residual)));
}

}  // namespace scrollfx
