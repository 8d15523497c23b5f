// filename: types.hpp
// part of Scroll-Driven Background Animation Engine
// MIT License

#pragma once

#include <array>
#include <stdexcept>
#include <string>

namespace scrollfx {

constexpr double kFullTurnDeg = 360.0;

struct HSLColor {
    double h{0.0};
    double s{0.0};
    double l{0.0};
};

using ColorPair = std::array<HSLColor, 2>;

/**
 * @brief Raised when an engine or one of its models is built from invalid parameters.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Raised on lifecycle misuse, e.g. starting a loop that is already running.
 */
class EngineStateError : public std::logic_error {
public:
    explicit EngineStateError(const std::string& message) : std::logic_error(message) {}
};

/**
 * @brief Clamp a progress value into [0, 1]. NaN maps to 0, +inf to 1, -inf to 0.
 */
[[nodiscard]] double sanitizeProgress(double value);

/**
 * @brief Wrap an angle in degrees into [0, 360).
 */
[[nodiscard]] double wrapDegrees(double angle);

}  // namespace scrollfx
