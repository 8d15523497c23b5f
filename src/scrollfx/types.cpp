// filename: types.cpp
// part of Scroll-Driven Background Animation Engine
// MIT License

#include "scrollfx/types.hpp"

#include <algorithm>
#include <cmath>

namespace scrollfx {

double sanitizeProgress(double value) {
    if (std::isnan(value)) {
        return 0.0;
    }
    return std::clamp(value, 0.0, 1.0);
}

double wrapDegrees(double angle) {
    if (!std::isfinite(angle)) {
        return 0.0;
    }
    double wrapped = std::fmod(angle, kFullTurnDeg);
    if (wrapped < 0.0) {
        wrapped += kFullTurnDeg;
    }
    // -1e-17 + 360 rounds back to 360
    if (wrapped >= kFullTurnDeg) {
        wrapped -= kFullTurnDeg;
    }
    return wrapped;
}

}  // namespace scrollfx
