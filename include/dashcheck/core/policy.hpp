// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dashcheck/core/config.hpp>
#include <dashcheck/core/http_session.hpp>
#include <dashcheck/media/manifest.hpp>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dashcheck::core {

// Header policy for a segment response
using SegmentPredicate = std::function<bool(const HeaderSet&)>;

// Header policy for the manifest response
using ManifestPredicate = std::function<bool(const HeaderSet&, media::PresentationType)>;

enum class ClockStatus : std::uint8_t { ok, bad };

[[nodiscard]] constexpr std::string_view to_string(ClockStatus status) noexcept {
    return status == ClockStatus::ok ? "OK" : "BAD";
}

struct TimestampResult {
    ClockStatus clock{ClockStatus::ok};
    std::optional<std::chrono::milliseconds> clock_offset;  // Dynamic manifests only
};

struct ManifestCheck {
    bool ok{false};
    HeaderSet headers;
};

// cache-control present, Date exposed and origin allowed for CORS.
// Missing list headers fail the policy rather than throwing.
[[nodiscard]] bool default_segment_predicate(const HeaderSet& headers);

// Dynamic manifests must not be cached for more than
// MAX_DYNAMIC_MANIFEST_MAX_AGE seconds. Static manifests always pass.
[[nodiscard]] bool default_manifest_predicate(const HeaderSet& headers, media::PresentationType type);

// Live-edge drift against `now`. Static manifests are always OK.
[[nodiscard]] TimestampResult check_timestamp(const media::Manifest& manifest,
                                              std::chrono::milliseconds allowed_drift,
                                              media::WallClock::time_point now = media::WallClock::now());

// Comma-separated header value split into trimmed tokens
[[nodiscard]] std::vector<std::string> split_header_list(std::string_view value);

// True when the comma-separated header `name` holds `token` (case-sensitive)
[[nodiscard]] bool header_list_contains(const HeaderSet& headers, std::string_view name, std::string_view token);

// max-age directive of a Cache-Control value
[[nodiscard]] std::optional<long long> parse_max_age(std::string_view cache_control) noexcept;

} // namespace dashcheck::core
