// filename: io_json.hpp
// part of Scroll-Driven Background Animation Engine
// MIT License

#pragma once

#include <string>

#include "scrollfx/engine.hpp"

namespace scrollfx {

/**
 * @brief Renderer hand-off document for one snapshot.
 *
 * "rotations" is a bare number when the engine drives a single entity.
 */
std::string snapshotToJson(const EngineSnapshot& snapshot, int indent = -1);

void write_json_snapshot(const std::string& path, const EngineSnapshot& snapshot);

}  // namespace scrollfx
