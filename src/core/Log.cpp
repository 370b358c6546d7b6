#include "core/Log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

static std::shared_ptr<spdlog::logger> g_logger;

void logsys::Init(spdlog::level::level_enum level) {
    if (!g_logger) {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        g_logger = std::make_shared<spdlog::logger>("stara", sink);
        spdlog::set_default_logger(g_logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e][%l] %v");
    }
    g_logger->set_level(level);
    spdlog::set_level(level);
}

std::shared_ptr<spdlog::logger> logsys::Get() {
    if (!g_logger) Init();
    return g_logger;
}
