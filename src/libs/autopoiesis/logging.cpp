#include "logging.h"
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace autopoiesis {

spdlog::level::level_enum parse_log_level(const std::string& name) {
    spdlog::level::level_enum level = spdlog::level::from_str(name);
    // from_str maps every unknown name to off
    if (level == spdlog::level::off && name != "off") {
        throw std::invalid_argument("Unknown log level: " + name);
    }
    return level;
}

void initialize_logging(const LoggingConfig& config) {
    spdlog::level::level_enum level = parse_log_level(config.level);

    try {
        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(level);
        console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);

        if (!config.log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file, true);
            file_sink->set_level(level);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("autopoiesis", sinks.begin(), sinks.end());
        logger->set_level(level);

        spdlog::set_default_logger(logger);

        spdlog::info("Logging initialized (level {})", config.level);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

} // namespace autopoiesis
