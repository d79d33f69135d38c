// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dashcheck/core/config.hpp>
#include <dashcheck/core/policy.hpp>
#include <dashcheck/core/transport.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace dashcheck::core {

// Reason recorded when a predicate rejects a segment
constexpr std::string_view POLICY_REASON = "policy";

enum class FailureKind : std::uint8_t {
    policy,     // Predicate returned false
    transport   // HEAD/GET failed
};

struct SegmentOk {
    std::string uri;
};

struct SegmentFailed {
    std::string uri;
    FailureKind kind{FailureKind::policy};
    std::string reason;
    std::error_code error;              // Set for transport failures
    std::optional<HeaderSet> headers;   // Set for policy failures
};

using SegmentOutcome = std::variant<SegmentOk, SegmentFailed>;

// ok and failed partition the probed segments, each in evaluation order
struct VerificationReport {
    std::vector<SegmentOk> ok;
    std::vector<SegmentFailed> failed;

    [[nodiscard]] std::size_t total() const noexcept { return ok.size() + failed.size(); }
    [[nodiscard]] bool all_ok() const noexcept { return failed.empty(); }
};

struct VerifyProgress {
    std::size_t completed{0};
    std::size_t total{0};
    std::size_t ok{0};
    std::size_t failed{0};
};

using VerifyCallback = std::function<void(const VerifyProgress&)>;
using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Sequential, rate-limited segment prober
class SegmentVerifier {
public:
    // Delays below MIN_PROBE_DELAY are raised to it. An empty sleeper
    // blocks the calling thread.
    SegmentVerifier(Transport& transport,
                    std::string base_url,
                    std::chrono::milliseconds probe_delay = DEFAULT_PROBE_DELAY,
                    Sleeper sleeper = {});

    // Probe every entry of `segments` once, in order. An empty predicate
    // selects default_segment_predicate.
    [[nodiscard]] VerificationReport verify(const SegmentPredicate& predicate,
                                            const std::vector<std::string>& segments,
                                            bool full_download);

    // Single probe, no delay
    [[nodiscard]] SegmentOutcome probe(const SegmentPredicate& predicate,
                                       const std::string& uri,
                                       bool full_download);

    void callback(VerifyCallback cb) noexcept { callback_ = std::move(cb); }

    [[nodiscard]] std::chrono::milliseconds probe_delay() const noexcept { return probe_delay_; }
    [[nodiscard]] const std::string& base_url() const noexcept { return base_url_; }

private:
    Transport& transport_;
    std::string base_url_;
    std::chrono::milliseconds probe_delay_;
    Sleeper sleeper_;
    VerifyCallback callback_;
};

} // namespace dashcheck::core
