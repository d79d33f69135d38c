// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dashcheck/core/manifest_runner.hpp>
#include <dashcheck/core/log.hpp>
#include <exception>

namespace dashcheck::core {

std::string_view to_string(RunnerEvent event) noexcept {
    switch (event) {
        case RunnerEvent::checking:          return "checking";
        case RunnerEvent::invalid_playhead:  return "invalidplayhead";
        case RunnerEvent::invalid_headers:   return "invalidheaders";
    }
    return "unknown";
}

std::optional<RunnerEvent> runner_event_from_name(std::string_view name) noexcept {
    if (name == "checking") return RunnerEvent::checking;
    if (name == "invalidplayhead") return RunnerEvent::invalid_playhead;
    if (name == "invalidheaders") return RunnerEvent::invalid_headers;
    return std::nullopt;
}

//=============================================================================
// ManifestRunner
//=============================================================================

ManifestRunner::ManifestRunner(std::shared_ptr<const media::Manifest> manifest,
                               HeaderSet headers,
                               RunnerConfig config)
    : config_(std::move(config))
    , manifest_(std::move(manifest))
    , headers_(std::move(headers)) {}

ManifestRunner::~ManifestRunner() {
    stop();
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::error_code ManifestRunner::begin() noexcept {
    auto expected = RunnerStatus::idle;
    if (status_.compare_exchange_strong(expected, RunnerStatus::running, std::memory_order_acq_rel)) {
        return {};
    }
    return expected == RunnerStatus::running
        ? make_error_code(ValidatorErrc::already_running)
        : make_error_code(ValidatorErrc::runner_stopped);
}

std::expected<RunSummary, std::error_code>
ManifestRunner::run(std::uint32_t iterations, RefreshFn refresh) {
    if (!refresh) {
        return std::unexpected(make_error_code(ValidatorErrc::invalid_argument));
    }
    if (auto ec = begin()) {
        return std::unexpected(ec);
    }
    return loop(iterations, refresh);
}

std::expected<std::future<RunSummary>, std::error_code>
ManifestRunner::start(std::uint32_t iterations, RefreshFn refresh) {
    if (!refresh) {
        return std::unexpected(make_error_code(ValidatorErrc::invalid_argument));
    }
    if (auto ec = begin()) {
        return std::unexpected(ec);
    }

    std::packaged_task<RunSummary()> task(
        [this, iterations, refresh = std::move(refresh)] { return loop(iterations, refresh); });
    auto future = task.get_future();
    worker_ = std::jthread([task = std::move(task)]() mutable { task(); });
    return future;
}

RunSummary ManifestRunner::loop(std::uint32_t iterations, const RefreshFn& refresh) {
    RunSummary summary;
    logger()->info("live validation started ({} iterations)", iterations);

    try {
        for (std::uint32_t i = 0; i < iterations; ++i) {
            if (stop_requested()) {
                summary.stopped_early = true;
                break;
            }

            emit(RunnerEvent::checking, CheckingEvent{i + 1});

            // A failed or throwing refresh costs one iteration, not the run
            try {
                if (auto ec = refresh(*this)) {
                    ++summary.refresh_failures;
                    logger()->warn("manifest refresh {} of {} failed: {}", i + 1, iterations, ec.message());
                }
            } catch (const std::exception& e) {
                ++summary.refresh_failures;
                logger()->warn("manifest refresh {} of {} threw: {}", i + 1, iterations, e.what());
            }

            ++summary.iterations_completed;
            iteration_.store(i + 1, std::memory_order_release);
        }
    } catch (...) {
        // Non-standard exception: the run is over, the caller sees it
        status_.store(RunnerStatus::stopped, std::memory_order_release);
        throw;
    }

    summary.invalid_playhead_count = invalid_playhead_count_.load(std::memory_order_acquire);
    summary.invalid_headers_count = invalid_headers_count_.load(std::memory_order_acquire);
    summary.final_manifest = manifest();
    summary.final_headers = headers();
    status_.store(RunnerStatus::stopped, std::memory_order_release);

    logger()->info("live validation finished: {} iterations, {} playhead and {} header violations",
                   summary.iterations_completed, summary.invalid_playhead_count,
                   summary.invalid_headers_count);
    return summary;
}

void ManifestRunner::update_manifest(std::shared_ptr<const media::Manifest> manifest, HeaderSet headers) {
    if (!manifest) {
        logger()->warn("update_manifest called without a manifest, ignored");
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        manifest_ = manifest;
        headers_ = headers;
    }

    const auto drift = check_timestamp(*manifest, config_.allowed_drift, now());
    if (drift.clock == ClockStatus::bad) {
        invalid_playhead_count_.fetch_add(1, std::memory_order_acq_rel);
        logger()->warn("live edge is {} ms from wall clock (allowed {} ms)",
                       drift.clock_offset.value_or(std::chrono::milliseconds{0}).count(),
                       config_.allowed_drift.count());
        emit(RunnerEvent::invalid_playhead,
             InvalidPlayheadEvent{drift.clock_offset.value_or(std::chrono::milliseconds{0}),
                                  config_.allowed_drift,
                                  manifest->time_at_head().value_or(media::WallClock::time_point{})});
    }

    bool headers_ok = false;
    try {
        headers_ok = config_.manifest_predicate
            ? config_.manifest_predicate(headers, manifest->type())
            : default_manifest_predicate(headers, manifest->type());
    } catch (const std::exception& e) {
        logger()->warn("manifest predicate threw: {}", e.what());
    } catch (...) {
        logger()->warn("manifest predicate threw a non-standard exception");
    }

    if (!headers_ok) {
        invalid_headers_count_.fetch_add(1, std::memory_order_acq_rel);
        logger()->warn("manifest response headers violate policy");
        emit(RunnerEvent::invalid_headers, InvalidHeadersEvent{std::move(headers), manifest->type()});
    }
}

void ManifestRunner::stop() noexcept {
    stop_requested_.store(true, std::memory_order_release);
    // A runner stopped before it started can never start
    auto expected = RunnerStatus::idle;
    status_.compare_exchange_strong(expected, RunnerStatus::stopped, std::memory_order_acq_rel);
}

void ManifestRunner::on(RunnerEvent event, RunnerListener listener) {
    if (!listener) return;
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_[static_cast<std::size_t>(event)].push_back(std::move(listener));
}

void ManifestRunner::on(std::string_view event_name, RunnerListener listener) {
    if (auto event = runner_event_from_name(event_name)) {
        on(*event, std::move(listener));
    }
}

void ManifestRunner::emit(RunnerEvent event, const RunnerEventData& data) {
    std::vector<RunnerListener> snapshot;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        snapshot = listeners_[static_cast<std::size_t>(event)];
    }

    // A failing listener must not end the run
    for (const auto& listener : snapshot) {
        try {
            listener(data);
        } catch (const std::exception& e) {
            logger()->error("{} listener threw: {}", to_string(event), e.what());
        } catch (...) {
            logger()->error("{} listener threw a non-standard exception", to_string(event));
        }
    }
}

std::shared_ptr<const media::Manifest> ManifestRunner::manifest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return manifest_;
}

HeaderSet ManifestRunner::headers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return headers_;
}

media::WallClock::time_point ManifestRunner::now() const {
    return config_.clock ? config_.clock() : media::WallClock::now();
}

} // namespace dashcheck::core
