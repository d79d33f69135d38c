// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <dashcheck/core/segment_verifier.hpp>
#include "fake_transport.hpp"
#include <stdexcept>

using namespace dashcheck;
using namespace dashcheck::core;
using namespace std::chrono_literals;

namespace {

const std::string BASE = "https://cdn.example.com/vod/";

struct RecordingSleeper {
    std::vector<std::chrono::milliseconds> delays;

    Sleeper sleeper() {
        return [this](std::chrono::milliseconds d) { delays.push_back(d); };
    }
};

} // namespace

TEST_CASE("SegmentVerifier partitions every segment", "[verifier]") {
    test::FakeTransport transport;
    transport.set_segment(BASE + "b.m4s", std::unexpected(make_error_code(ValidatorErrc::not_found)));
    transport.set_segment(BASE + "c.m4s", HeaderSet{{"content-type", "video/mp4"}});

    RecordingSleeper sleeps;
    SegmentVerifier verifier(transport, BASE, 50ms, sleeps.sleeper());

    const std::vector<std::string> segments{"a.m4s", "b.m4s", "c.m4s", "d.m4s"};
    auto report = verifier.verify({}, segments, false);

    CHECK(report.total() == segments.size());
    CHECK(!report.all_ok());

    REQUIRE(report.ok.size() == 2);
    CHECK(report.ok[0].uri == "a.m4s");
    CHECK(report.ok[1].uri == "d.m4s");

    REQUIRE(report.failed.size() == 2);
    CHECK(report.failed[0].uri == "b.m4s");
    CHECK(report.failed[0].kind == FailureKind::transport);
    CHECK(report.failed[0].error == ValidatorErrc::not_found);
    CHECK(!report.failed[0].headers.has_value());

    CHECK(report.failed[1].uri == "c.m4s");
    CHECK(report.failed[1].kind == FailureKind::policy);
    CHECK(report.failed[1].reason == POLICY_REASON);
    REQUIRE(report.failed[1].headers.has_value());
    CHECK(report.failed[1].headers->at("content-type") == "video/mp4");

    // Every segment was requested exactly once, in order
    REQUIRE(transport.head_requests.size() == 4);
    CHECK(transport.head_requests[0] == BASE + "a.m4s");
    CHECK(transport.head_requests[3] == BASE + "d.m4s");
    CHECK(transport.get_requests.empty());
}

TEST_CASE("SegmentVerifier rate limiting", "[verifier]") {
    test::FakeTransport transport;
    RecordingSleeper sleeps;

    SECTION("Delay only between probes") {
        SegmentVerifier verifier(transport, BASE, 75ms, sleeps.sleeper());
        auto report = verifier.verify({}, {"1.m4s", "2.m4s", "3.m4s", "4.m4s", "5.m4s"}, false);
        CHECK(report.total() == 5);
        REQUIRE(sleeps.delays.size() == 4);
        for (auto d : sleeps.delays) {
            CHECK(d == 75ms);
        }
    }

    SECTION("Delay below the minimum is raised") {
        SegmentVerifier verifier(transport, BASE, 0ms, sleeps.sleeper());
        CHECK(verifier.probe_delay() == MIN_PROBE_DELAY);
        auto report = verifier.verify({}, {"1.m4s", "2.m4s"}, false);
        CHECK(report.total() == 2);
        REQUIRE(sleeps.delays.size() == 1);
        CHECK(sleeps.delays[0] == MIN_PROBE_DELAY);
    }

    SECTION("Single segment never sleeps") {
        SegmentVerifier verifier(transport, BASE, 50ms, sleeps.sleeper());
        auto report = verifier.verify({}, {"only.m4s"}, false);
        CHECK(report.ok.size() == 1);
        CHECK(sleeps.delays.empty());
    }

    SECTION("Empty list makes no requests") {
        SegmentVerifier verifier(transport, BASE, 50ms, sleeps.sleeper());
        auto report = verifier.verify({}, {}, false);
        CHECK(report.total() == 0);
        CHECK(report.all_ok());
        CHECK(transport.segment_requests() == 0);
        CHECK(sleeps.delays.empty());
    }
}

TEST_CASE("SegmentVerifier full download uses GET", "[verifier]") {
    test::FakeTransport transport;
    RecordingSleeper sleeps;
    SegmentVerifier verifier(transport, BASE, 10ms, sleeps.sleeper());

    auto report = verifier.verify({}, {"a.m4s", "https://other.example.com/b.m4s"}, true);
    CHECK(report.ok.size() == 2);
    CHECK(transport.head_requests.empty());
    REQUIRE(transport.get_requests.size() == 2);
    CHECK(transport.get_requests[0] == BASE + "a.m4s");
    CHECK(transport.get_requests[1] == "https://other.example.com/b.m4s");
}

TEST_CASE("SegmentVerifier custom predicates", "[verifier]") {
    test::FakeTransport transport;
    RecordingSleeper sleeps;
    SegmentVerifier verifier(transport, BASE, 10ms, sleeps.sleeper());

    SECTION("Predicate sees the response headers") {
        std::vector<std::string> seen;
        auto report = verifier.verify(
            [&seen](const HeaderSet& headers) {
                seen.push_back(headers.at("cache-control"));
                return true;
            },
            {"a.m4s", "b.m4s"}, false);
        CHECK(report.ok.size() == 2);
        REQUIRE(seen.size() == 2);
        CHECK(seen[0] == "max-age=3600");
    }

    SECTION("Rejecting predicate") {
        auto report = verifier.verify([](const HeaderSet&) { return false; }, {"a.m4s"}, false);
        REQUIRE(report.failed.size() == 1);
        CHECK(report.failed[0].kind == FailureKind::policy);
    }

    SECTION("Throwing predicate is a policy failure") {
        auto report = verifier.verify(
            [](const HeaderSet&) -> bool { throw std::runtime_error("bad predicate"); },
            {"a.m4s", "b.m4s"}, false);
        CHECK(report.ok.empty());
        REQUIRE(report.failed.size() == 2);
        CHECK(report.failed[1].kind == FailureKind::policy);
    }
}

TEST_CASE("SegmentVerifier progress callback", "[verifier]") {
    test::FakeTransport transport;
    transport.set_segment(BASE + "2.m4s", std::unexpected(make_error_code(ValidatorErrc::server_error)));
    RecordingSleeper sleeps;
    SegmentVerifier verifier(transport, BASE, 10ms, sleeps.sleeper());

    std::vector<VerifyProgress> updates;
    verifier.callback([&updates](const VerifyProgress& p) { updates.push_back(p); });

    auto report = verifier.verify({}, {"1.m4s", "2.m4s", "3.m4s"}, false);
    CHECK(report.failed.size() == 1);

    REQUIRE(updates.size() == 3);
    CHECK(updates[0].completed == 1);
    CHECK(updates[1].failed == 1);
    CHECK(updates[2].completed == 3);
    CHECK(updates[2].total == 3);
    CHECK(updates[2].ok == 2);
}
