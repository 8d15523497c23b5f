// filename: io_csv.cpp
// part of Scroll-Driven Background Animation Engine
// MIT License

#include "scrollfx/io_csv.hpp"

#include <fstream>
#include <stdexcept>

namespace scrollfx {

void write_csv_snapshot_series(const std::string& path, const std::vector<EngineSnapshot>& snapshots) {
    const std::size_t rotationCount = snapshots.empty() ? 0 : snapshots.front().rotationCount();
    for (const auto& snapshot : snapshots) {
        if (snapshot.rotationCount() != rotationCount) {
            throw std::invalid_argument("write_csv_snapshot_series: mismatched rotation counts");
        }
    }

    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open CSV output: " + path);
    }

    ofs << "frame,time_ms,progress,y_offset,x_offset,h0,s0,l0,h1,s1,l1";
    for (std::size_t i = 0; i < rotationCount; ++i) {
        ofs << ",rot_" << i;
    }
    ofs << '\n';

    for (const auto& snapshot : snapshots) {
        const HSLColor& a = snapshot.colorPair[0];
        const HSLColor& b = snapshot.colorPair[1];
        ofs << snapshot.frameIndex << ',' << snapshot.timestampMs << ',' << snapshot.progress << ','
            << snapshot.yOffset << ',' << snapshot.xOffset << ',' << a.h << ',' << a.s << ',' << a.l
            << ',' << b.h << ',' << b.s << ',' << b.l;
        for (std::size_t i = 0; i < rotationCount; ++i) {
            ofs << ',' << snapshot.rotation(i);
        }
        ofs << '\n';
    }
}

}  // namespace scrollfx
