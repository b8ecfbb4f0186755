#include "filett/Logging.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <vector>

namespace FileTT {

bool parseLogLevel(const std::string& level) {
    return spdlog::level::from_str(level) != spdlog::level::off || level == "off";
}

void configureLogging(const std::string& level, const std::string& logFile) {
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::vector<spdlog::sink_ptr> sinks{consoleSink};
    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, false);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S] [%l] [%t] %v");
        sinks.push_back(fileSink);
    }

    auto logger = std::make_shared<spdlog::logger>("filett", sinks.begin(), sinks.end());
    logger->set_level(parseLogLevel(level) ? spdlog::level::from_str(level) : spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (!parseLogLevel(level)) {
        spdlog::warn("Logging: unknown level '{}', using info", level);
    }
}

} // namespace FileTT
