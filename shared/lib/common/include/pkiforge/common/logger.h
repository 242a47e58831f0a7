/**
 * @file logger.h
 * @brief spdlog setup for the pkiforge tool
 *
 * Console output goes to stderr with a compact pattern; the optional log
 * file gets timestamps and is rotated at 10 MB (3 files kept).
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pkiforge::common {

class Logger {
public:
    static constexpr const char* CONSOLE_PATTERN = "[%^%l%$] %v";
    static constexpr const char* FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

    /**
     * @brief Map a level name (trace, debug, info, warn, error, critical, off)
     * @return spdlog level, or std::nullopt for an unknown name
     */
    static std::optional<spdlog::level::level_enum> parseLevel(const std::string& logLevel) {
        if (logLevel == "trace") return spdlog::level::trace;
        if (logLevel == "debug") return spdlog::level::debug;
        if (logLevel == "info") return spdlog::level::info;
        if (logLevel == "warn") return spdlog::level::warn;
        if (logLevel == "error") return spdlog::level::err;
        if (logLevel == "critical") return spdlog::level::critical;
        if (logLevel == "off") return spdlog::level::off;
        return std::nullopt;
    }

    /**
     * @brief Install the default logger
     * @param name Logger name written to the log file
     * @param logLevel Level name; unknown names fall back to info with a warning
     * @param logToFile Add the rotating file sink
     * @param logFile Log file path
     */
    static void initialize(
        const std::string& name,
        const std::string& logLevel = "info",
        bool logToFile = false,
        const std::string& logFile = ""
    ) {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            consoleSink->set_pattern(CONSOLE_PATTERN);
            sinks.push_back(consoleSink);

            if (logToFile && !logFile.empty()) {
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logFile, 1024 * 1024 * 10, 3);
                fileSink->set_pattern(FILE_PATTERN);
                sinks.push_back(fileSink);
            }

            auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
            auto level = parseLevel(logLevel);
            logger->set_level(level.value_or(spdlog::level::info));

            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::warn);

            if (!level) {
                spdlog::warn("Unknown log level '{}', using info", logLevel);
            }
            spdlog::debug("Logger initialized: level={}, file={}", logLevel, logToFile ? logFile : "none");

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        }
    }

    static void flush() {
        spdlog::default_logger()->flush();
    }
};

} // namespace pkiforge::common
