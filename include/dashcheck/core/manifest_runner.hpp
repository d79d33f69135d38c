// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dashcheck/core/config.hpp>
#include <dashcheck/core/error.hpp>
#include <dashcheck/core/policy.hpp>
#include <dashcheck/media/manifest.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>
#include <variant>
#include <vector>

namespace dashcheck::core {

enum class RunnerStatus : std::uint8_t {
    idle,       // Constructed, not started
    running,    // Iterating
    stopped     // Terminal
};

enum class RunnerEvent : std::uint8_t {
    checking,
    invalid_playhead,
    invalid_headers
};

constexpr std::size_t RUNNER_EVENT_COUNT = 3;

// Wire names: "checking", "invalidplayhead", "invalidheaders"
[[nodiscard]] std::string_view to_string(RunnerEvent event) noexcept;
[[nodiscard]] std::optional<RunnerEvent> runner_event_from_name(std::string_view name) noexcept;

struct CheckingEvent {
    std::uint32_t iteration{0};     // 1-based
};

struct InvalidPlayheadEvent {
    std::chrono::milliseconds offset{0};
    std::chrono::milliseconds threshold{0};
    media::WallClock::time_point time_at_head;
};

struct InvalidHeadersEvent {
    HeaderSet headers;
    media::PresentationType type{media::PresentationType::dynamic};
};

using RunnerEventData = std::variant<CheckingEvent, InvalidPlayheadEvent, InvalidHeadersEvent>;
using RunnerListener = std::function<void(const RunnerEventData&)>;

struct RunnerConfig {
    std::chrono::milliseconds allowed_drift{DEFAULT_ALLOWED_CLOCK_DRIFT};
    ManifestPredicate manifest_predicate;                   // Empty: default_manifest_predicate
    std::function<media::WallClock::time_point()> clock;    // Empty: system clock
};

struct RunSummary {
    std::uint32_t iterations_completed{0};
    std::uint32_t invalid_playhead_count{0};
    std::uint32_t invalid_headers_count{0};
    std::uint32_t refresh_failures{0};
    bool stopped_early{false};
    std::shared_ptr<const media::Manifest> final_manifest;
    HeaderSet final_headers;
};

class ManifestRunner;

// Re-fetches the manifest and hands it over through update_manifest().
// A non-zero return marks the iteration's refresh as failed.
using RefreshFn = std::function<std::error_code(ManifestRunner&)>;

// Polls a live manifest and checks live-edge drift and header policy on
// every refresh. Iterations never overlap; the only wait inside an
// iteration is the refresh call.
class ManifestRunner {
public:
    ManifestRunner(std::shared_ptr<const media::Manifest> manifest,
                   HeaderSet headers,
                   RunnerConfig config = {});
    ~ManifestRunner();

    ManifestRunner(const ManifestRunner&) = delete;
    ManifestRunner& operator=(const ManifestRunner&) = delete;
    ManifestRunner(ManifestRunner&&) = delete;
    ManifestRunner& operator=(ManifestRunner&&) = delete;

    // Run on the calling thread until `iterations` are done or stop() is seen
    [[nodiscard]] std::expected<RunSummary, std::error_code>
    run(std::uint32_t iterations, RefreshFn refresh);

    // Same loop on a worker thread. An exception escaping `refresh` ends
    // the run and is rethrown by future::get().
    [[nodiscard]] std::expected<std::future<RunSummary>, std::error_code>
    start(std::uint32_t iterations, RefreshFn refresh);

    // Swap in a freshly parsed manifest and check it
    void update_manifest(std::shared_ptr<const media::Manifest> manifest, HeaderSet headers);

    // Cooperative: the current iteration finishes, no new one starts
    void stop() noexcept;

    void on(RunnerEvent event, RunnerListener listener);

    // Unknown event names are ignored so callers are not coupled to the
    // internal event set
    void on(std::string_view event_name, RunnerListener listener);

    [[nodiscard]] RunnerStatus status() const noexcept { return status_.load(std::memory_order_acquire); }
    [[nodiscard]] std::uint32_t iteration() const noexcept { return iteration_.load(std::memory_order_acquire); }
    [[nodiscard]] bool stop_requested() const noexcept { return stop_requested_.load(std::memory_order_acquire); }

    [[nodiscard]] std::shared_ptr<const media::Manifest> manifest() const;
    [[nodiscard]] HeaderSet headers() const;

private:
    [[nodiscard]] std::error_code begin() noexcept;
    [[nodiscard]] RunSummary loop(std::uint32_t iterations, const RefreshFn& refresh);
    void emit(RunnerEvent event, const RunnerEventData& data);
    [[nodiscard]] media::WallClock::time_point now() const;

    RunnerConfig config_;

    mutable std::mutex mutex_;      // Protects manifest_ and headers_
    std::shared_ptr<const media::Manifest> manifest_;
    HeaderSet headers_;

    std::mutex listeners_mutex_;
    std::array<std::vector<RunnerListener>, RUNNER_EVENT_COUNT> listeners_;

    std::atomic<RunnerStatus> status_{RunnerStatus::idle};
    std::atomic<bool> stop_requested_{false};
    std::atomic<std::uint32_t> iteration_{0};
    std::atomic<std::uint32_t> invalid_playhead_count_{0};
    std::atomic<std::uint32_t> invalid_headers_count_{0};

    std::jthread worker_;
};

} // namespace dashcheck::core
