// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dashcheck/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace dashcheck::core {

namespace {

constexpr const char* LOGGER_NAME = "dashcheck";

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get(LOGGER_NAME);
        if (existing) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt(LOGGER_NAME);
        created->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        created->set_level(spdlog::level::info);
        return created;
    }();
    return instance;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace dashcheck::core
