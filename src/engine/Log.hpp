#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace orrery {

class Log {
public:
    static void init(const std::string& logFile = "", const std::string& level = "info");
    static void shutdown();

    static std::shared_ptr<spdlog::logger>& getSimLogger();
    static std::shared_ptr<spdlog::logger>& getRenderLogger();

private:
    static std::shared_ptr<spdlog::logger> s_simLogger;
    static std::shared_ptr<spdlog::logger> s_renderLogger;
};

} // namespace orrery

// Simulation logging macros
#define LOG_TRACE(...)    ::orrery::Log::getSimLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)    ::orrery::Log::getSimLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)     ::orrery::Log::getSimLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)     ::orrery::Log::getSimLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)    ::orrery::Log::getSimLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::orrery::Log::getSimLogger()->critical(__VA_ARGS__)

// Renderer logging macros
#define RENDER_LOG_TRACE(...)    ::orrery::Log::getRenderLogger()->trace(__VA_ARGS__)
#define RENDER_LOG_DEBUG(...)    ::orrery::Log::getRenderLogger()->debug(__VA_ARGS__)
#define RENDER_LOG_INFO(...)     ::orrery::Log::getRenderLogger()->info(__VA_ARGS__)
#define RENDER_LOG_WARN(...)     ::orrery::Log::getRenderLogger()->warn(__VA_ARGS__)
#define RENDER_LOG_ERROR(...)    ::orrery::Log::getRenderLogger()->error(__VA_ARGS__)
#define RENDER_LOG_CRITICAL(...) ::orrery::Log::getRenderLogger()->critical(__VA_ARGS__)
