// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dashcheck/core/policy.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>

namespace dashcheck::core {

namespace {

std::string_view trim(std::string_view value) noexcept {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
        value.remove_suffix(1);
    }
    return value;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace

std::vector<std::string> split_header_list(std::string_view value) {
    std::vector<std::string> tokens;
    while (true) {
        auto comma = value.find(',');
        auto token = trim(value.substr(0, comma));
        if (!token.empty()) {
            tokens.emplace_back(token);
        }
        if (comma == std::string_view::npos) break;
        value.remove_prefix(comma + 1);
    }
    return tokens;
}

bool header_list_contains(const HeaderSet& headers, std::string_view name, std::string_view token) {
    auto it = headers.find(std::string(name));
    if (it == headers.end()) {
        return false;
    }
    const auto tokens = split_header_list(it->second);
    return std::find(tokens.begin(), tokens.end(), token) != tokens.end();
}

std::optional<long long> parse_max_age(std::string_view cache_control) noexcept {
    constexpr std::string_view DIRECTIVE = "max-age";

    while (!cache_control.empty()) {
        auto comma = cache_control.find(',');
        auto directive = trim(cache_control.substr(0, comma));
        cache_control = comma == std::string_view::npos
            ? std::string_view{}
            : cache_control.substr(comma + 1);

        auto eq = directive.find('=');
        if (eq == std::string_view::npos || !iequals(trim(directive.substr(0, eq)), DIRECTIVE)) {
            continue;
        }

        auto value = trim(directive.substr(eq + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        long long seconds = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), seconds);
        if (ec != std::errc() || ptr != value.data() + value.size() || seconds < 0) {
            return std::nullopt;
        }
        return seconds;
    }
    return std::nullopt;
}

bool default_segment_predicate(const HeaderSet& headers) {
    return headers.contains("cache-control") &&
           header_list_contains(headers, "access-control-expose-headers", "Date") &&
           header_list_contains(headers, "access-control-allow-headers", "origin");
}

bool default_manifest_predicate(const HeaderSet& headers, media::PresentationType type) {
    if (type != media::PresentationType::dynamic) {
        return true;
    }
    auto it = headers.find("cache-control");
    if (it == headers.end()) {
        return false;
    }
    auto max_age = parse_max_age(it->second);
    return max_age && *max_age <= MAX_DYNAMIC_MANIFEST_MAX_AGE;
}

TimestampResult check_timestamp(const media::Manifest& manifest,
                                std::chrono::milliseconds allowed_drift,
                                media::WallClock::time_point now) {
    TimestampResult result;
    const auto* live = manifest.live();
    if (!live) {
        return result;
    }

    auto diff = std::chrono::duration_cast<std::chrono::milliseconds>(live->time_at_head - now);
    auto offset = diff < std::chrono::milliseconds::zero() ? -diff : diff;
    result.clock = offset > allowed_drift ? ClockStatus::bad : ClockStatus::ok;
    result.clock_offset = offset;
    return result;
}

} // namespace dashcheck::core
