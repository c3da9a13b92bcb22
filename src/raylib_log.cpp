#include "logging.hpp"
#include <raylib.h>
#include <spdlog/spdlog.h>
#include <cstdarg>
#include <cstdio>

namespace relay::logging {

static void raylib_to_spdlog(int level, const char* text, va_list args) {
    char buf[512];
    std::vsnprintf(buf, sizeof(buf), text, args);
    switch (level) {
        case LOG_TRACE:   spdlog::trace("raylib: {}", buf);    break;
        case LOG_DEBUG:   spdlog::debug("raylib: {}", buf);    break;
        case LOG_INFO:    spdlog::info("raylib: {}", buf);     break;
        case LOG_WARNING: spdlog::warn("raylib: {}", buf);     break;
        case LOG_ERROR:   spdlog::error("raylib: {}", buf);    break;
        case LOG_FATAL:   spdlog::critical("raylib: {}", buf); break;
        default:          spdlog::info("raylib: {}", buf);     break;
    }
}

void forward_raylib() {
    SetTraceLogCallback(raylib_to_spdlog);
}

} // namespace relay::logging
