// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <dashcheck/core/manifest_runner.hpp>
#include <stdexcept>

using namespace dashcheck;
using namespace dashcheck::core;
using namespace std::chrono_literals;

namespace {

const media::WallClock::time_point NOW = media::WallClock::time_point{} + 1'000'000s;

std::shared_ptr<const media::Manifest> live_manifest(media::WallClock::time_point head) {
    media::DynamicTiming timing;
    timing.time_at_head = head;
    timing.availability_start_time = head - 120s;
    return std::make_shared<const media::Manifest>(
        media::Manifest::make_dynamic(media::Seconds{0.0}, {"seg-1.m4s", "seg-2.m4s"}, timing));
}

const HeaderSet FRESH_HEADERS{{"cache-control", "max-age=2"}};

RunnerConfig fixed_clock_config() {
    RunnerConfig config;
    config.allowed_drift = 10s;
    config.clock = [] { return NOW; };
    return config;
}

struct EventLog {
    std::vector<std::uint32_t> checking;
    std::vector<InvalidPlayheadEvent> playhead;
    std::vector<InvalidHeadersEvent> headers;

    void attach(ManifestRunner& runner) {
        runner.on("checking", [this](const RunnerEventData& e) {
            checking.push_back(std::get<CheckingEvent>(e).iteration);
        });
        runner.on("invalidplayhead", [this](const RunnerEventData& e) {
            playhead.push_back(std::get<InvalidPlayheadEvent>(e));
        });
        runner.on("invalidheaders", [this](const RunnerEventData& e) {
            headers.push_back(std::get<InvalidHeadersEvent>(e));
        });
    }
};

} // namespace

TEST_CASE("Runner event names", "[runner]") {
    CHECK(to_string(RunnerEvent::checking) == "checking");
    CHECK(to_string(RunnerEvent::invalid_playhead) == "invalidplayhead");
    CHECK(to_string(RunnerEvent::invalid_headers) == "invalidheaders");

    CHECK(runner_event_from_name("invalidheaders") == RunnerEvent::invalid_headers);
    CHECK(!runner_event_from_name("progress").has_value());
    CHECK(!runner_event_from_name("Checking").has_value());
}

TEST_CASE("ManifestRunner healthy live stream", "[runner]") {
    ManifestRunner runner(live_manifest(NOW), FRESH_HEADERS, fixed_clock_config());
    EventLog log;
    log.attach(runner);
    CHECK(runner.status() == RunnerStatus::idle);

    auto summary = runner.run(4, [](ManifestRunner& r) {
        r.update_manifest(live_manifest(NOW - 2s), FRESH_HEADERS);
        return std::error_code{};
    });

    REQUIRE(summary.has_value());
    CHECK(summary->iterations_completed == 4);
    CHECK(summary->invalid_playhead_count == 0);
    CHECK(summary->invalid_headers_count == 0);
    CHECK(summary->refresh_failures == 0);
    CHECK(!summary->stopped_early);
    CHECK(summary->final_manifest != nullptr);
    CHECK(summary->final_headers == FRESH_HEADERS);

    CHECK(log.checking == std::vector<std::uint32_t>{1, 2, 3, 4});
    CHECK(log.playhead.empty());
    CHECK(log.headers.empty());
    CHECK(runner.status() == RunnerStatus::stopped);
    CHECK(runner.iteration() == 4);
}

TEST_CASE("ManifestRunner stale live edge", "[runner]") {
    ManifestRunner runner(live_manifest(NOW), FRESH_HEADERS, fixed_clock_config());
    EventLog log;
    log.attach(runner);

    auto summary = runner.run(3, [](ManifestRunner& r) {
        r.update_manifest(live_manifest(NOW - 25s), FRESH_HEADERS);
        return std::error_code{};
    });

    REQUIRE(summary.has_value());
    CHECK(summary->invalid_playhead_count == 3);
    REQUIRE(log.playhead.size() == 3);
    CHECK(log.playhead[0].offset == 25000ms);
    CHECK(log.playhead[0].threshold == 10000ms);
    CHECK(log.playhead[0].time_at_head == NOW - 25s);
    CHECK(log.headers.empty());
}

TEST_CASE("ManifestRunner invalid manifest headers", "[runner]") {
    ManifestRunner runner(live_manifest(NOW), FRESH_HEADERS, fixed_clock_config());
    EventLog log;
    log.attach(runner);

    const HeaderSet cached{{"cache-control", "max-age=60"}};
    auto summary = runner.run(2, [&cached](ManifestRunner& r) {
        r.update_manifest(live_manifest(NOW), cached);
        return std::error_code{};
    });

    REQUIRE(summary.has_value());
    CHECK(summary->invalid_headers_count == 2);
    REQUIRE(log.headers.size() == 2);
    CHECK(log.headers[0].headers == cached);
    CHECK(log.headers[0].type == media::PresentationType::dynamic);
    CHECK(log.playhead.empty());
}

TEST_CASE("ManifestRunner custom manifest predicate", "[runner]") {
    auto config = fixed_clock_config();
    config.manifest_predicate = [](const HeaderSet& headers, media::PresentationType) {
        return headers.contains("x-live");
    };
    ManifestRunner runner(live_manifest(NOW), {}, config);

    int calls = 0;
    auto summary = runner.run(2, [&calls](ManifestRunner& r) {
        HeaderSet headers;
        if (++calls == 2) headers["x-live"] = "1";
        r.update_manifest(live_manifest(NOW), headers);
        return std::error_code{};
    });

    REQUIRE(summary.has_value());
    CHECK(summary->invalid_headers_count == 1);
}

TEST_CASE("ManifestRunner refresh failure is not fatal", "[runner]") {
    ManifestRunner runner(live_manifest(NOW), FRESH_HEADERS, fixed_clock_config());
    EventLog log;
    log.attach(runner);

    std::uint32_t calls = 0;
    auto summary = runner.run(3, [&calls](ManifestRunner& r) {
        if (++calls == 2) {
            return make_error_code(ValidatorErrc::timeout);
        }
        r.update_manifest(live_manifest(NOW), FRESH_HEADERS);
        return std::error_code{};
    });

    REQUIRE(summary.has_value());
    CHECK(calls == 3);
    CHECK(summary->iterations_completed == 3);
    CHECK(summary->refresh_failures == 1);
    CHECK(log.checking.size() == 3);
}

TEST_CASE("ManifestRunner refresh exception is not fatal", "[runner]") {
    ManifestRunner runner(live_manifest(NOW), FRESH_HEADERS, fixed_clock_config());

    std::uint32_t calls = 0;
    auto summary = runner.run(3, [&calls](ManifestRunner& r) -> std::error_code {
        if (++calls == 2) {
            throw std::runtime_error("connection reset");
        }
        r.update_manifest(live_manifest(NOW), FRESH_HEADERS);
        return {};
    });

    REQUIRE(summary.has_value());
    CHECK(calls == 3);
    CHECK(summary->iterations_completed == 3);
    CHECK(summary->refresh_failures == 1);
    CHECK(summary->invalid_headers_count == 0);
}

TEST_CASE("ManifestRunner throwing manifest predicate counts as a header violation", "[runner]") {
    auto config = fixed_clock_config();
    config.manifest_predicate = [](const HeaderSet&, media::PresentationType) -> bool {
        throw 7;
    };
    ManifestRunner runner(live_manifest(NOW), FRESH_HEADERS, config);

    auto summary = runner.run(2, [](ManifestRunner& r) {
        r.update_manifest(live_manifest(NOW), FRESH_HEADERS);
        return std::error_code{};
    });

    REQUIRE(summary.has_value());
    CHECK(summary->iterations_completed == 2);
    CHECK(summary->invalid_headers_count == 2);
}

TEST_CASE("ManifestRunner listeners", "[runner]") {
    ManifestRunner runner(live_manifest(NOW), FRESH_HEADERS, fixed_clock_config());

    SECTION("Unknown event names are ignored") {
        bool called = false;
        runner.on("progress", [&called](const RunnerEventData&) { called = true; });
        runner.on("", [&called](const RunnerEventData&) { called = true; });

        auto summary = runner.run(2, [](ManifestRunner& r) {
            r.update_manifest(live_manifest(NOW - 60s), {});
            return std::error_code{};
        });
        REQUIRE(summary.has_value());
        CHECK(summary->iterations_completed == 2);
        CHECK(!called);
    }

    SECTION("Throwing listener does not stop the run") {
        std::uint32_t after = 0;
        runner.on(RunnerEvent::checking, [](const RunnerEventData&) {
            throw std::runtime_error("listener failed");
        });
        runner.on(RunnerEvent::checking, [&after](const RunnerEventData&) { ++after; });

        auto summary = runner.run(3, [](ManifestRunner&) { return std::error_code{}; });
        REQUIRE(summary.has_value());
        CHECK(summary->iterations_completed == 3);
        CHECK(after == 3);
    }

    SECTION("Several listeners per event, in registration order") {
        std::vector<int> order;
        runner.on("checking", [&order](const RunnerEventData&) { order.push_back(1); });
        runner.on("checking", [&order](const RunnerEventData&) { order.push_back(2); });

        auto summary = runner.run(1, [](ManifestRunner&) { return std::error_code{}; });
        REQUIRE(summary.has_value());
        CHECK(order == std::vector<int>{1, 2});
    }
}

TEST_CASE("ManifestRunner lifecycle", "[runner]") {
    ManifestRunner runner(live_manifest(NOW), FRESH_HEADERS, fixed_clock_config());
    auto noop = [](ManifestRunner&) { return std::error_code{}; };

    SECTION("Zero iterations") {
        auto summary = runner.run(0, noop);
        REQUIRE(summary.has_value());
        CHECK(summary->iterations_completed == 0);
        CHECK(runner.status() == RunnerStatus::stopped);
    }

    SECTION("A runner runs once") {
        REQUIRE(runner.run(1, noop).has_value());
        auto again = runner.run(1, noop);
        REQUIRE(!again.has_value());
        CHECK(again.error() == ValidatorErrc::runner_stopped);
    }

    SECTION("Stop before start") {
        runner.stop();
        CHECK(runner.status() == RunnerStatus::stopped);
        auto summary = runner.run(3, noop);
        REQUIRE(!summary.has_value());
        CHECK(summary.error() == ValidatorErrc::runner_stopped);
    }

    SECTION("Stop from a listener ends the run after the current iteration") {
        runner.on("checking", [&runner](const RunnerEventData& e) {
            if (std::get<CheckingEvent>(e).iteration == 2) runner.stop();
        });
        std::uint32_t refreshes = 0;
        auto summary = runner.run(10, [&refreshes](ManifestRunner&) {
            ++refreshes;
            return std::error_code{};
        });
        REQUIRE(summary.has_value());
        CHECK(refreshes == 2);
        CHECK(summary->iterations_completed == 2);
        CHECK(summary->stopped_early);
        CHECK(runner.status() == RunnerStatus::stopped);
    }

    SECTION("Missing refresh function") {
        auto summary = runner.run(1, RefreshFn{});
        REQUIRE(!summary.has_value());
        CHECK(summary.error() == ValidatorErrc::invalid_argument);
        CHECK(runner.status() == RunnerStatus::idle);
    }
}

TEST_CASE("ManifestRunner background run", "[runner]") {
    ManifestRunner runner(live_manifest(NOW), FRESH_HEADERS, fixed_clock_config());

    SECTION("Future carries the summary") {
        auto future = runner.start(3, [](ManifestRunner& r) {
            r.update_manifest(live_manifest(NOW - 30s), FRESH_HEADERS);
            return std::error_code{};
        });
        REQUIRE(future.has_value());
        auto summary = future->get();
        CHECK(summary.iterations_completed == 3);
        CHECK(summary.invalid_playhead_count == 3);
        CHECK(runner.status() == RunnerStatus::stopped);
    }

    SECTION("Second start is rejected while running") {
        std::promise<void> release;
        auto gate = release.get_future().share();
        auto future = runner.start(1, [gate](ManifestRunner&) {
            gate.wait();
            return std::error_code{};
        });
        REQUIRE(future.has_value());

        auto second = runner.run(1, [](ManifestRunner&) { return std::error_code{}; });
        REQUIRE(!second.has_value());
        CHECK(second.error() == ValidatorErrc::already_running);

        release.set_value();
        CHECK(future->get().iterations_completed == 1);
    }

    SECTION("Exception from one refresh is counted and the run goes on") {
        std::uint32_t calls = 0;
        auto future = runner.start(3, [&calls](ManifestRunner&) -> std::error_code {
            if (++calls == 2) {
                throw std::runtime_error("refresh exploded");
            }
            return {};
        });
        REQUIRE(future.has_value());
        auto summary = future->get();
        CHECK(calls == 3);
        CHECK(summary.iterations_completed == 3);
        CHECK(summary.refresh_failures == 1);
        CHECK(runner.status() == RunnerStatus::stopped);
    }

    SECTION("Non-standard exception from refresh reaches the future") {
        auto future = runner.start(2, [](ManifestRunner&) -> std::error_code {
            throw 42;
        });
        REQUIRE(future.has_value());
        CHECK_THROWS_AS(future->get(), int);
        CHECK(runner.status() == RunnerStatus::stopped);
    }
}
