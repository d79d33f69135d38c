// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace dashcheck::core {

// Shared "dashcheck" logger, writes to stderr
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

// Set verbosity for the shared logger
void set_log_level(spdlog::level::level_enum level);

} // namespace dashcheck::core
