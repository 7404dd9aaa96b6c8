#ifndef AUTOPOIESIS_LOGGING_H
#define AUTOPOIESIS_LOGGING_H

#include <string>
#include <spdlog/spdlog.h>

namespace autopoiesis {

struct LoggingConfig {
    std::string level;
    // Empty means console only.
    std::string log_file;

    LoggingConfig() : level("info"), log_file() {}
};

// Throws std::invalid_argument for names spdlog does not know.
spdlog::level::level_enum parse_log_level(const std::string& name);

// Installs the default logger: colored console sink plus an optional file sink.
void initialize_logging(const LoggingConfig& config);

} // namespace autopoiesis

#endif // AUTOPOIESIS_LOGGING_H
