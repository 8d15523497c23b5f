// filename: io_json.cpp
// part of Scroll-Driven Background Animation Engine
// MIT License

#include "scrollfx/io_json.hpp"

#include "scrollfx/color.hpp"

#include <fstream>
#include <stdexcept>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace scrollfx {
namespace {

nlohmann::json colorToJson(const HSLColor& color) {
    return nlohmann::json{{"h", color.h}, {"s", color.s}, {"l", color.l}, {"css", formatHslCss(color)}};
}

}  // namespace

std::string snapshotToJson(const EngineSnapshot& snapshot, int indent) {
    nlohmann::json doc;
    doc["frame"] = snapshot.frameIndex;
    doc["timeMs"] = snapshot.timestampMs;
    doc["progress"] = snapshot.progress;
    doc["colorPair"] = nlohmann::json::array({colorToJson(snapshot.colorPair[0]),
                                              colorToJson(snapshot.colorPair[1])});
    if (const auto* many = std::get_if<std::vector<double>>(&snapshot.rotations)) {
        doc["rotations"] = *many;
    } else {
        doc["rotations"] = std::get<double>(snapshot.rotations);
    }
    doc["yOffset"] = snapshot.yOffset;
    doc["xOffset"] = snapshot.xOffset;
    return doc.dump(indent);
}

void write_json_snapshot(const std::string& path, const EngineSnapshot& snapshot) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open JSON output: " + path);
    }
    ofs << snapshotToJson(snapshot, 2) << '\n';
}

}  // namespace scrollfx
