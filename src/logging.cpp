#include "logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace relay::logging {

void init(spdlog::level::level_enum level) {
    auto logger = spdlog::get("relay");
    if (!logger) logger = spdlog::stderr_color_mt("relay");
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
}

} // namespace relay::logging
