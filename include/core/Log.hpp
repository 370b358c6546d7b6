#pragma once
#include <memory>
#include <spdlog/spdlog.h>

namespace logsys {
    // Colored stderr logger "stara", installed as spdlog's default.
    void Init(spdlog::level::level_enum level = spdlog::level::info);
    std::shared_ptr<spdlog::logger> Get();
}
