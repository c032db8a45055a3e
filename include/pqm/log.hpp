#pragma once

#include <string>

#include <spdlog/common.h>

namespace pqm {

// spdlog level for a level name; unknown names select info
spdlog::level::level_enum log_level_from_name(const std::string& level);

// Set the spdlog default logger level from a level name
// ("trace", "debug", "info", "warn", "error", "critical", "off").
// Unknown names select "info".
void configure_logging(const std::string& level);

// Route the default logger to stderr so stdout stays machine-readable
void log_to_stderr();

} // namespace pqm
