// filename: rotation.hpp
// part of Scroll-Driven Background Animation Engine
// MIT License

#pragma once

#include <cstddef>
#include <random>
#include <vector>

namespace scrollfx {

enum class SpeedResponse {
    Steer,    // scroll sets the target speed, current speed eases toward it
    Impulse,  // scroll kicks the current speed, which decays to the cruise speed
};

struct SpeedConfig {
    double min{0.1};
    double max{0.55};
    double multiplier{30.0};
    double baseRotationSpeed{10.0};  // deg/s per unit of base speed
    double positionExponent{0.3};
    double minRotationSpeed{10.0};   // deg/s
    double dampingConstant{1.25};
    SpeedResponse response{SpeedResponse::Steer};
};

/**
 * @throws ConfigurationError for min < 0, max < min, a negative floor,
 *         dampingConstant < 1 or non-finite values.
 */
void validateSpeedConfig(const SpeedConfig& config);

struct EntityState {
    std::size_t index{0};
    double baseSpeed{0.0};
    double currentSpeed{0.0};
    double targetSpeed{0.0};
    double rotationAngle{0.0};
};

class RotationFieldSimulator {
public:
    RotationFieldSimulator() = default;

    /**
     * @brief Assign base speeds and starting angles for @p count entities.
     *
     * May be called once; the entity array is fixed afterwards.
     */
    void initialize(std::size_t count, const SpeedConfig& config, std::mt19937& rng);

    [[nodiscard]] bool is_active() const { return !entities_.empty(); }

    void onProgressChange(double previous, double latest);

    void tick(double dtSeconds);

    [[nodiscard]] const std::vector<EntityState>& entities() const { return entities_; }
    [[nodiscard]] std::vector<double> rotations() const;
    [[nodiscard]] double direction() const { return direction_; }
    [[nodiscard]] const SpeedConfig& config() const { return config_; }

    /// Fraction of the remaining speed gap closed by a tick of @p dtSeconds.
    [[nodiscard]] double interpolationFactor(double dtSeconds) const;

    /// -1 when progress grew, +1 otherwise.
    [[nodiscard]] static double scrollDirection(double previous, double latest);

    [[nodiscard]] static double positionWeight(std::size_t index, std::size_t count);

    /**
     * @brief Ticks of fixed @p dtSeconds until a speed gap of @p gap is within @p epsilon.
     */
    [[nodiscard]] static std::size_t ticksToConverge(double gap, double epsilon, double dtSeconds,
                                                     double dampingConstant);

private:
    [[nodiscard]] double cruiseSpeed(const EntityState& entity) const;
    [[nodiscard]] double scrollSpeed(const EntityState& entity) const;
    [[nodiscard]] double floored(double magnitude) const;

    SpeedConfig config_{};
    std::vector<EntityState> entities_;
    double direction_{1.0};
};

}  // namespace scrollfx
