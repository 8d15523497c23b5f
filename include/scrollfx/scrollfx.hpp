// filename: scrollfx.hpp
// part of Scroll-Driven Background Animation Engine
// MIT License

#pragma once

#include "color.hpp"
#include "engine.hpp"
#include "frame_clock.hpp"
#include "ingest.hpp"
#include "io_csv.hpp"
#include "io_json.hpp"
#include "progress.hpp"
#include "rotation.hpp"
#include "spring.hpp"
#include "types.hpp"
