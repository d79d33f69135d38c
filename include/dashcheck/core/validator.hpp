// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dashcheck/core/config.hpp>
#include <dashcheck/core/error.hpp>
#include <dashcheck/core/manifest_runner.hpp>
#include <dashcheck/core/policy.hpp>
#include <dashcheck/core/segment_verifier.hpp>
#include <dashcheck/core/transport.hpp>
#include <dashcheck/media/manifest.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dashcheck::core {

// Validates one MPEG-DASH presentation: manifest headers, live-edge timing
// and segment delivery policy.
class Validator {
public:
    // A null transport selects HttpTransport
    explicit Validator(std::string src,
                       ValidatorConfig config = {},
                       std::shared_ptr<Transport> transport = nullptr);
    ~Validator();

    Validator(const Validator&) = delete;
    Validator& operator=(const Validator&) = delete;

    // Fetch and parse the manifest. Transport and parse errors are returned.
    [[nodiscard]] std::error_code load();

    [[nodiscard]] bool is_loaded() const;
    [[nodiscard]] const std::string& src() const noexcept { return src_; }
    [[nodiscard]] const std::string& base_url() const noexcept { return base_url_; }
    [[nodiscard]] const ValidatorConfig& config() const noexcept { return config_; }

    [[nodiscard]] std::shared_ptr<const media::Manifest> manifest() const;
    [[nodiscard]] HeaderSet headers() const;

    [[nodiscard]] std::expected<media::Seconds, std::error_code> duration() const;
    [[nodiscard]] std::expected<std::vector<std::string>, std::error_code> segment_urls() const;
    [[nodiscard]] std::expected<bool, std::error_code> is_live() const;

    [[nodiscard]] std::expected<TimestampResult, std::error_code>
    verify_timestamps(std::chrono::milliseconds allowed_drift = DEFAULT_ALLOWED_CLOCK_DRIFT) const;

    // An empty predicate selects default_manifest_predicate
    [[nodiscard]] std::expected<ManifestCheck, std::error_code>
    verify_manifest(const ManifestPredicate& predicate = {}) const;

    [[nodiscard]] std::expected<VerificationReport, std::error_code>
    verify_segments(const SegmentPredicate& predicate,
                    const std::vector<std::string>& segments,
                    bool full_download);

    [[nodiscard]] std::expected<VerificationReport, std::error_code>
    verify_all_segments(const SegmentPredicate& predicate, bool full_download);

    // `count` draws with replacement from the manifest's segments
    [[nodiscard]] std::expected<VerificationReport, std::error_code>
    spotcheck_segments(const SegmentPredicate& predicate, std::size_t count, bool full_download);

    // Poll the live manifest `iterations` times
    [[nodiscard]] std::expected<RunSummary, std::error_code>
    validate_dynamic_manifest(std::uint32_t iterations);

    // Same event names as ManifestRunner::on, unknown names ignored. Kept
    // across loads and applied to every live run, including one in progress.
    void on(std::string_view event_name, RunnerListener listener);

    // Stops an in-progress live run after its current iteration
    void stop() noexcept;

    void segment_callback(VerifyCallback cb) { segment_callback_ = std::move(cb); }

private:
    [[nodiscard]] std::vector<std::string> sample_segments(const std::vector<std::string>& segments,
                                                           std::size_t count);
    [[nodiscard]] std::error_code refresh(ManifestRunner& runner, bool wait);

    std::string src_;
    std::string base_url_;
    ValidatorConfig config_;
    std::shared_ptr<Transport> transport_;
    std::mt19937_64 rng_;
    VerifyCallback segment_callback_;

    mutable std::mutex mutex_;      // Protects manifest_ and headers_
    std::shared_ptr<const media::Manifest> manifest_;
    HeaderSet headers_;

    std::mutex runner_mutex_;       // Protects runner_ and listeners_
    std::vector<std::pair<RunnerEvent, RunnerListener>> listeners_;
    std::shared_ptr<ManifestRunner> runner_;
};

} // namespace dashcheck::core
