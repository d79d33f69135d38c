// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dashcheck/core/transport.hpp>
#include <deque>
#include <map>
#include <string>
#include <vector>

namespace dashcheck::test {

// Headers that satisfy default_segment_predicate
inline core::HeaderSet good_segment_headers() {
    return {
        {"cache-control", "max-age=3600"},
        {"access-control-expose-headers", "Date, Content-Length"},
        {"access-control-allow-headers", "origin, range"},
    };
}

// Scripted in-memory transport. Manifest responses are consumed in order,
// the last one repeats. Segment results are looked up by URL.
class FakeTransport final : public core::Transport {
public:
    using ManifestResult = std::expected<core::ManifestResponse, std::error_code>;
    using SegmentResult = std::expected<core::HeaderSet, std::error_code>;

    void push_manifest(std::string body, core::HeaderSet headers = {}) {
        manifests_.push_back(core::ManifestResponse{std::move(body), std::move(headers)});
    }

    void push_manifest_error(std::error_code ec) {
        manifests_.push_back(std::unexpected(ec));
    }

    void set_segment(const std::string& url, SegmentResult result) {
        segments_[url] = std::move(result);
    }

    // Result for URLs without an explicit entry
    void set_default_segment(SegmentResult result) { default_segment_ = std::move(result); }

    [[nodiscard]] ManifestResult fetch_manifest(const std::string& uri) override {
        manifest_requests.push_back(uri);
        if (manifests_.empty()) {
            return std::unexpected(make_error_code(core::ValidatorErrc::not_found));
        }
        auto result = manifests_.front();
        if (manifests_.size() > 1) {
            manifests_.pop_front();
        }
        return result;
    }

    [[nodiscard]] SegmentResult fetch_segment_headers(const std::string& uri) override {
        head_requests.push_back(uri);
        return lookup(uri);
    }

    [[nodiscard]] SegmentResult fetch_segment_full(const std::string& uri) override {
        get_requests.push_back(uri);
        return lookup(uri);
    }

    [[nodiscard]] std::size_t segment_requests() const noexcept {
        return head_requests.size() + get_requests.size();
    }

    std::vector<std::string> manifest_requests;
    std::vector<std::string> head_requests;
    std::vector<std::string> get_requests;

private:
    SegmentResult lookup(const std::string& uri) const {
        auto it = segments_.find(uri);
        return it != segments_.end() ? it->second : default_segment_;
    }

    std::deque<ManifestResult> manifests_;
    std::map<std::string, SegmentResult> segments_;
    SegmentResult default_segment_{good_segment_headers()};
};

} // namespace dashcheck::test
