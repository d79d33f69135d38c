// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <dashcheck/core/url.hpp>

using namespace dashcheck::core;

TEST_CASE("Url::parse - valid URLs", "[url]") {
    SECTION("HTTPS URL") {
        auto result = Url::parse("https://example.com/live/manifest.mpd");
        REQUIRE(result.has_value());
        auto url = *result;
        CHECK(url.scheme() == "https");
        CHECK(url.host() == "example.com");
        CHECK(url.path() == "/live/manifest.mpd");
    }

    SECTION("HTTP URL with port") {
        auto result = Url::parse("http://example.com:8080/path");
        REQUIRE(result.has_value());
        auto url = *result;
        CHECK(url.scheme() == "http");
        CHECK(url.port() == "8080");
        CHECK(url.origin() == "http://example.com:8080");
    }

    SECTION("URL with query and fragment") {
        auto result = Url::parse("https://example.com/manifest.mpd?token=abc#t=10");
        REQUIRE(result.has_value());
        auto url = *result;
        CHECK(url.path() == "/manifest.mpd");
        CHECK(url.query() == "token=abc");
        CHECK(url.fragment() == "t=10");
        CHECK(url.directory() == "https://example.com/");
    }

    SECTION("IPv6 host") {
        auto result = Url::parse("http://[::1]:8000/a.mpd");
        REQUIRE(result.has_value());
        CHECK(result->host() == "[::1]");
        CHECK(result->port() == "8000");
    }

    SECTION("Host only") {
        auto result = Url::parse("https://cdn.example.com");
        REQUIRE(result.has_value());
        CHECK(result->path() == "/");
    }
}

TEST_CASE("Url::parse - invalid URLs", "[url]") {
    CHECK(!Url::parse("example.com/manifest.mpd").has_value());
    CHECK(!Url::parse("").has_value());
    CHECK(!Url::parse("ftp://example.com/manifest.mpd").has_value());
    CHECK(!Url::parse("https:///manifest.mpd").has_value());
    CHECK(!Url::parse("http://example.com:80a/").has_value());

    auto result = Url::parse("not a url");
    REQUIRE(!result.has_value());
    CHECK(result.error() == ValidatorErrc::invalid_url);
}

TEST_CASE("resolve_base_url", "[url]") {
    SECTION("Directory of the manifest") {
        auto base = resolve_base_url("https://cdn.example.com/vod/title/manifest.mpd");
        REQUIRE(base.has_value());
        CHECK(*base == "https://cdn.example.com/vod/title/");
    }

    SECTION("Query is dropped") {
        auto base = resolve_base_url("http://example.com:8080/live/stream.mpd?session=1");
        REQUIRE(base.has_value());
        CHECK(*base == "http://example.com:8080/live/");
    }

    SECTION("Manifest at the root") {
        auto base = resolve_base_url("https://example.com/manifest.mpd");
        REQUIRE(base.has_value());
        CHECK(*base == "https://example.com/");
    }

    SECTION("Invalid URI") {
        auto base = resolve_base_url("manifest.mpd");
        REQUIRE(!base.has_value());
        CHECK(base.error() == ValidatorErrc::invalid_url);
    }
}

TEST_CASE("resolve_url", "[url]") {
    const std::string base = "https://cdn.example.com/vod/title/";

    SECTION("Relative reference is appended") {
        CHECK(resolve_url(base, "video/seg-1.m4s") == "https://cdn.example.com/vod/title/video/seg-1.m4s");
    }

    SECTION("Missing separator is added") {
        CHECK(resolve_url("https://cdn.example.com/vod", "seg-1.m4s") == "https://cdn.example.com/vod/seg-1.m4s");
    }

    SECTION("Absolute reference passes through") {
        CHECK(resolve_url(base, "https://other.example.com/seg.m4s") == "https://other.example.com/seg.m4s");
    }

    SECTION("Origin-relative reference") {
        CHECK(resolve_url(base, "/shared/init.mp4") == "https://cdn.example.com/shared/init.mp4");
    }

    SECTION("Empty base") {
        CHECK(resolve_url("", "seg-1.m4s") == "seg-1.m4s");
    }

    CHECK(is_absolute_url("http://example.com/a"));
    CHECK(!is_absolute_url("a/b.m4s"));
}
