#pragma once
#include <spdlog/common.h>

namespace relay::logging {

// Installs the "relay" stderr logger as spdlog's default and sets its level.
// stdout stays free for piping; stdin carries commands in the viewer.
void init(spdlog::level::level_enum level);

// Routes Raylib's TraceLog output through spdlog. Viewer only.
void forward_raylib();

} // namespace relay::logging
