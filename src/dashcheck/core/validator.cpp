// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dashcheck/core/validator.hpp>
#include <dashcheck/core/log.hpp>
#include <dashcheck/core/url.hpp>
#include <dashcheck/media/dash_parser.hpp>
#include <exception>
#include <thread>

namespace dashcheck::core {

namespace {

std::uint64_t seed_for(const ValidatorConfig& config) {
    if (config.seed) {
        return *config.seed;
    }
    std::random_device device;
    return (static_cast<std::uint64_t>(device()) << 32) | device();
}

} // namespace

Validator::Validator(std::string src, ValidatorConfig config, std::shared_ptr<Transport> transport)
    : src_(std::move(src))
    , config_(config)
    , transport_(transport ? std::move(transport) : std::make_shared<HttpTransport>())
    , rng_(seed_for(config_)) {}

Validator::~Validator() {
    stop();
}

std::error_code Validator::load() {
    auto base = resolve_base_url(src_);
    if (!base) {
        logger()->error("invalid manifest URL {}: {}", src_, base.error().message());
        return base.error();
    }
    base_url_ = std::move(*base);

    auto response = transport_->fetch_manifest(src_);
    if (!response) {
        logger()->error("failed to fetch {}: {}", src_, response.error().message());
        return response.error();
    }

    auto parsed = media::DASHParser::parse(response->body);
    if (!parsed) {
        logger()->error("failed to parse {}: {}", src_, parsed.error().message());
        return parsed.error();
    }

    auto manifest = std::make_shared<const media::Manifest>(std::move(*parsed));
    logger()->info("loaded {} manifest with {} segments",
                   media::to_string(manifest->type()), manifest->segments().size());

    std::lock_guard<std::mutex> lock(mutex_);
    manifest_ = std::move(manifest);
    headers_ = std::move(response->headers);
    return {};
}

bool Validator::is_loaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return manifest_ != nullptr;
}

std::shared_ptr<const media::Manifest> Validator::manifest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return manifest_;
}

HeaderSet Validator::headers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return headers_;
}

std::expected<media::Seconds, std::error_code> Validator::duration() const {
    auto m = manifest();
    if (!m) return std::unexpected(make_error_code(ValidatorErrc::not_loaded));
    return m->total_duration();
}

std::expected<std::vector<std::string>, std::error_code> Validator::segment_urls() const {
    auto m = manifest();
    if (!m) return std::unexpected(make_error_code(ValidatorErrc::not_loaded));
    return m->segments();
}

std::expected<bool, std::error_code> Validator::is_live() const {
    auto m = manifest();
    if (!m) return std::unexpected(make_error_code(ValidatorErrc::not_loaded));
    return m->is_live();
}

std::expected<TimestampResult, std::error_code>
Validator::verify_timestamps(std::chrono::milliseconds allowed_drift) const {
    auto m = manifest();
    if (!m) return std::unexpected(make_error_code(ValidatorErrc::not_loaded));
    return check_timestamp(*m, allowed_drift);
}

std::expected<ManifestCheck, std::error_code>
Validator::verify_manifest(const ManifestPredicate& predicate) const {
    std::shared_ptr<const media::Manifest> m;
    ManifestCheck check;
    {
        // Manifest and headers from the same load
        std::lock_guard<std::mutex> lock(mutex_);
        m = manifest_;
        check.headers = headers_;
    }
    if (!m) return std::unexpected(make_error_code(ValidatorErrc::not_loaded));

    try {
        check.ok = predicate ? predicate(check.headers, m->type())
                             : default_manifest_predicate(check.headers, m->type());
    } catch (const std::exception& e) {
        logger()->warn("manifest predicate threw: {}", e.what());
        check.ok = false;
    }
    return check;
}

std::expected<VerificationReport, std::error_code>
Validator::verify_segments(const SegmentPredicate& predicate,
                           const std::vector<std::string>& segments,
                           bool full_download) {
    if (!is_loaded()) return std::unexpected(make_error_code(ValidatorErrc::not_loaded));

    SegmentVerifier verifier(*transport_, base_url_, config_.probe_delay);
    if (segment_callback_) {
        verifier.callback(segment_callback_);
    }
    return verifier.verify(predicate, segments, full_download);
}

std::expected<VerificationReport, std::error_code>
Validator::verify_all_segments(const SegmentPredicate& predicate, bool full_download) {
    auto m = manifest();
    if (!m) return std::unexpected(make_error_code(ValidatorErrc::not_loaded));
    return verify_segments(predicate, m->segments(), full_download);
}

std::expected<VerificationReport, std::error_code>
Validator::spotcheck_segments(const SegmentPredicate& predicate, std::size_t count, bool full_download) {
    auto m = manifest();
    if (!m) return std::unexpected(make_error_code(ValidatorErrc::not_loaded));
    if (count == 0) {
        return VerificationReport{};
    }
    return verify_segments(predicate, sample_segments(m->segments(), count), full_download);
}

std::vector<std::string> Validator::sample_segments(const std::vector<std::string>& segments,
                                                    std::size_t count) {
    std::vector<std::string> sample;
    if (segments.empty()) {
        return sample;
    }
    sample.reserve(count);
    std::uniform_int_distribution<std::size_t> pick(0, segments.size() - 1);
    for (std::size_t i = 0; i < count; ++i) {
        sample.push_back(segments[pick(rng_)]);
    }
    return sample;
}

std::expected<RunSummary, std::error_code>
Validator::validate_dynamic_manifest(std::uint32_t iterations) {
    auto m = manifest();
    if (!m) return std::unexpected(make_error_code(ValidatorErrc::not_loaded));

    RunnerConfig runner_config;
    runner_config.allowed_drift = config_.allowed_drift;

    auto runner = std::make_shared<ManifestRunner>(m, headers(), runner_config);
    {
        std::lock_guard<std::mutex> lock(runner_mutex_);
        if (runner_ && runner_->status() == RunnerStatus::running) {
            return std::unexpected(make_error_code(ValidatorErrc::already_running));
        }
        for (const auto& [event, listener] : listeners_) {
            runner->on(event, listener);
        }
        runner_ = runner;
    }

    bool first = true;
    auto result = runner->run(iterations, [this, &first](ManifestRunner& r) {
        const bool wait = !first;
        first = false;
        return refresh(r, wait);
    });

    std::lock_guard<std::mutex> lock(runner_mutex_);
    if (runner_ == runner) {
        runner_.reset();
    }
    return result;
}

std::error_code Validator::refresh(ManifestRunner& runner, bool wait) {
    if (wait && config_.poll_interval.count() > 0) {
        std::this_thread::sleep_for(config_.poll_interval);
    }

    auto response = transport_->fetch_manifest(src_);
    if (!response) {
        return response.error();
    }

    auto parsed = media::DASHParser::parse(response->body);
    if (!parsed) {
        return parsed.error();
    }

    auto manifest = std::make_shared<const media::Manifest>(std::move(*parsed));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        manifest_ = manifest;
        headers_ = response->headers;
    }
    runner.update_manifest(std::move(manifest), std::move(response->headers));
    return {};
}

void Validator::on(std::string_view event_name, RunnerListener listener) {
    auto event = runner_event_from_name(event_name);
    if (!event || !listener) {
        return;
    }

    std::lock_guard<std::mutex> lock(runner_mutex_);
    if (runner_) {
        runner_->on(*event, listener);
    }
    listeners_.emplace_back(*event, std::move(listener));
}

void Validator::stop() noexcept {
    std::lock_guard<std::mutex> lock(runner_mutex_);
    if (runner_) {
        runner_->stop();
    }
}

} // namespace dashcheck::core
