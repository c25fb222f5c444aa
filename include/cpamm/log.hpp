#ifndef CPAMM_LOG_HPP
#define CPAMM_LOG_HPP

#include <string>
#include <spdlog/common.h>

namespace cpamm {

// Maps "trace|debug|info|warn|error|off" to a level; anything else is info
spdlog::level::level_enum parse_log_level(const std::string& level);

// Installs a colored stdout logger named "cpamm" as the spdlog default
void setup_logging(const std::string& level);

} // namespace cpamm

#endif // CPAMM_LOG_HPP
