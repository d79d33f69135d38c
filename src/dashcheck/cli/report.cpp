// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dashcheck/cli/report.hpp>
#include <iomanip>
#include <sstream>

namespace dashcheck::cli {

namespace {

std::string_view kind_name(core::FailureKind kind) noexcept {
    return kind == core::FailureKind::policy ? "policy" : "transport";
}

void append_headers(std::ostringstream& out, const core::HeaderSet& headers) {
    for (const auto& [name, value] : headers) {
        out << "      " << name << ": " << value << '\n';
    }
}

} // namespace

bool ValidationReport::passed() const noexcept {
    if (manifest_check && !manifest_check->ok) return false;
    if (timestamps && timestamps->clock == core::ClockStatus::bad) return false;
    if (segments && !segments->all_ok()) return false;
    if (live && (live->invalid_playhead_count > 0 ||
                 live->invalid_headers_count > 0 ||
                 live->refresh_failures > 0)) {
        return false;
    }
    return true;
}

bool ValidationReport::complete() const noexcept {
    return !live || live->refresh_failures == 0;
}

nlohmann::json report_json(const core::VerificationReport& report) {
    nlohmann::json ok = nlohmann::json::array();
    for (const auto& seg : report.ok) {
        ok.push_back({{"uri", seg.uri}});
    }

    nlohmann::json failed = nlohmann::json::array();
    for (const auto& seg : report.failed) {
        nlohmann::json entry = {
            {"uri", seg.uri},
            {"kind", std::string(kind_name(seg.kind))},
            {"reason", seg.reason},
        };
        if (seg.headers) {
            entry["headers"] = *seg.headers;
        }
        failed.push_back(std::move(entry));
    }

    return {{"ok", std::move(ok)}, {"failed", std::move(failed)}};
}

nlohmann::json report_json(const core::TimestampResult& result) {
    nlohmann::json j = {{"clock", std::string(core::to_string(result.clock))}};
    if (result.clock_offset) {
        j["clockOffset"] = result.clock_offset->count();
    }
    return j;
}

nlohmann::json report_json(const core::ManifestCheck& check) {
    return {{"ok", check.ok}, {"headers", check.headers}};
}

nlohmann::json report_json(const core::RunSummary& summary) {
    nlohmann::json j = {
        {"iterations", summary.iterations_completed},
        {"invalidPlayhead", summary.invalid_playhead_count},
        {"invalidHeaders", summary.invalid_headers_count},
        {"refreshFailures", summary.refresh_failures},
        {"stoppedEarly", summary.stopped_early},
    };
    if (summary.final_manifest) {
        j["segments"] = summary.final_manifest->segments().size();
        if (auto head = summary.final_manifest->time_at_head()) {
            j["timeAtHead"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                head->time_since_epoch()).count();
        }
    }
    return j;
}

nlohmann::json report_json(const ValidationReport& report) {
    nlohmann::json j = {
        {"url", report.url},
        {"type", std::string(media::to_string(report.type))},
        {"duration", report.duration_seconds},
        {"segmentCount", report.segment_count},
        {"passed", report.passed()},
        {"complete", report.complete()},
    };
    if (report.manifest_check) j["manifest"] = report_json(*report.manifest_check);
    if (report.timestamps) j["timestamps"] = report_json(*report.timestamps);
    if (report.segments) j["segments"] = report_json(*report.segments);
    if (report.live) j["live"] = report_json(*report.live);
    return j;
}

std::string render_text(const ValidationReport& report) {
    std::ostringstream out;
    out << "Manifest: " << report.url << '\n';
    out << "Type: " << media::to_string(report.type)
        << "  Duration: " << std::fixed << std::setprecision(1) << report.duration_seconds << "s"
        << "  Segments: " << report.segment_count << '\n';

    if (report.manifest_check) {
        out << "Manifest headers: " << (report.manifest_check->ok ? "OK" : "FAILED") << '\n';
        if (!report.manifest_check->ok) {
            append_headers(out, report.manifest_check->headers);
        }
    }

    if (report.timestamps) {
        out << "Clock: " << core::to_string(report.timestamps->clock);
        if (report.timestamps->clock_offset) {
            out << " (offset " << report.timestamps->clock_offset->count() << " ms)";
        }
        out << '\n';
    }

    if (report.segments) {
        out << "Segments: " << report.segments->ok.size() << " ok, "
            << report.segments->failed.size() << " failed\n";
        for (const auto& seg : report.segments->failed) {
            out << "  FAIL " << seg.uri << " [" << kind_name(seg.kind) << "] " << seg.reason << '\n';
            if (seg.headers) {
                append_headers(out, *seg.headers);
            }
        }
    }

    if (report.live) {
        out << "Live: " << report.live->iterations_completed << " iterations, "
            << report.live->invalid_playhead_count << " invalid playhead, "
            << report.live->invalid_headers_count << " invalid headers, "
            << report.live->refresh_failures << " refresh failures";
        if (report.live->stopped_early) {
            out << " (stopped early)";
        }
        out << '\n';
    }

    out << "Result: " << (!report.complete() ? "ERROR" : report.passed() ? "PASS" : "FAIL") << '\n';
    return out.str();
}

} // namespace dashcheck::cli
