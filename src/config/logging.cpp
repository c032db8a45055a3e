#include "pqm/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace pqm {

spdlog::level::level_enum log_level_from_name(const std::string& level) {
    // from_str answers "off" for names it does not know
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") return spdlog::level::info;
    return parsed;
}

void configure_logging(const std::string& level) {
    spdlog::set_level(log_level_from_name(level));
    spdlog::set_pattern("[%l] %v");
}

void log_to_stderr() {
    auto logger = spdlog::get("pqm");
    if (!logger) {
        logger = spdlog::stderr_color_mt("pqm");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%l] %v");
}

} // namespace pqm
