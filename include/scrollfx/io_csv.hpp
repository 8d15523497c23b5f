// filename: io_csv.hpp
// part of Scroll-Driven Background Animation Engine
// MIT License

#pragma once

#include <string>
#include <vector>

#include "scrollfx/engine.hpp"

namespace scrollfx {

/**
 * @brief Write one row per snapshot:
 *        frame,time_ms,progress,y_offset,x_offset,h0,s0,l0,h1,s1,l1,rot_0..rot_{N-1}
 */
void write_csv_snapshot_series(const std::string& path, const std::vector<EngineSnapshot>& snapshots);

}  // namespace scrollfx
