// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>
#include <optional>
#include <string_view>

namespace dashcheck::core {

constexpr std::chrono::milliseconds DEFAULT_PROBE_DELAY{50};        // Between segment probes
constexpr std::chrono::milliseconds MIN_PROBE_DELAY{10};            // Floor, delay can't be disabled
constexpr std::chrono::milliseconds DEFAULT_ALLOWED_CLOCK_DRIFT{10000};
constexpr std::chrono::milliseconds DEFAULT_POLL_INTERVAL{2000};    // Live manifest refresh

constexpr long long MAX_DYNAMIC_MANIFEST_MAX_AGE = 10;              // Seconds

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 10;
constexpr std::uint32_t REQUEST_TIMEOUT_SEC = 30;
constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

constexpr std::string_view USER_AGENT = "dashcheck/0.1";

// Runtime knobs for a Validator
struct ValidatorConfig {
    std::chrono::milliseconds probe_delay{DEFAULT_PROBE_DELAY};
    std::chrono::milliseconds allowed_drift{DEFAULT_ALLOWED_CLOCK_DRIFT};
    std::chrono::milliseconds poll_interval{DEFAULT_POLL_INTERVAL};
    std::optional<std::uint64_t> seed;  // Spotcheck RNG seed, random when unset
};

} // namespace dashcheck::core
