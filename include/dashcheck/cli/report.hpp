// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dashcheck/core/manifest_runner.hpp>
#include <dashcheck/core/policy.hpp>
#include <dashcheck/core/segment_verifier.hpp>
#include <dashcheck/media/manifest.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace dashcheck::cli {

// Everything one CLI invocation checked for a manifest
struct ValidationReport {
    std::string url;
    media::PresentationType type{media::PresentationType::static_};
    double duration_seconds{0.0};
    std::size_t segment_count{0};

    std::optional<core::ManifestCheck> manifest_check;
    std::optional<core::TimestampResult> timestamps;
    std::optional<core::VerificationReport> segments;
    std::optional<core::RunSummary> live;

    // No policy, timing or delivery violation in any executed check
    [[nodiscard]] bool passed() const noexcept;

    // False when a live manifest refresh could not be fetched or parsed
    [[nodiscard]] bool complete() const noexcept;
};

[[nodiscard]] nlohmann::json report_json(const core::VerificationReport& report);
[[nodiscard]] nlohmann::json report_json(const core::TimestampResult& result);
[[nodiscard]] nlohmann::json report_json(const core::ManifestCheck& check);
[[nodiscard]] nlohmann::json report_json(const core::RunSummary& summary);
[[nodiscard]] nlohmann::json report_json(const ValidationReport& report);

// Human-readable summary for stdout
[[nodiscard]] std::string render_text(const ValidationReport& report);

} // namespace dashcheck::cli
