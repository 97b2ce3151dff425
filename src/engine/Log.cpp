#include "engine/Log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <vector>

namespace orrery {

std::shared_ptr<spdlog::logger> Log::s_simLogger;
std::shared_ptr<spdlog::logger> Log::s_renderLogger;

void Log::init(const std::string& logFile, const std::string& level) {
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern("[%H:%M:%S] [%n] [%^%l%$] %v");
    sinks.push_back(consoleSink);

    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        sinks.push_back(fileSink);
    }

    // Re-init replaces any previous registration under the same names
    spdlog::drop("SIM");
    spdlog::drop("RENDER");

    s_simLogger = std::make_shared<spdlog::logger>("SIM", sinks.begin(), sinks.end());
    s_renderLogger = std::make_shared<spdlog::logger>("RENDER", sinks.begin(), sinks.end());

    // from_str maps unknown names to "off"; those fall back to info instead
    auto spdLevel = spdlog::level::from_str(level);
    bool unknownLevel = spdLevel == spdlog::level::off && level != "off";
    if (unknownLevel) {
        spdLevel = spdlog::level::info;
    }

    s_simLogger->set_level(spdLevel);
    s_renderLogger->set_level(spdLevel);

    spdlog::register_logger(s_simLogger);
    spdlog::register_logger(s_renderLogger);

    if (unknownLevel) {
        s_simLogger->warn("Unknown log level '{}', using info", level);
    }
}

void Log::shutdown() {
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& Log::getSimLogger() {
    if (!s_simLogger) {
        init();
    }
    return s_simLogger;
}

std::shared_ptr<spdlog::logger>& Log::getRenderLogger() {
    if (!s_renderLogger) {
        init();
    }
    return s_renderLogger;
}

} // namespace orrery
