// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dashcheck/core/http_session.hpp>
#include <string>
#include <expected>
#include <system_error>

namespace dashcheck::core {

struct ManifestResponse {
    std::string body;
    HeaderSet headers;
};

// Network access used by the validator. Implementations are called from a
// single thread at a time and own any timeout policy.
class Transport {
public:
    virtual ~Transport() = default;

    // GET the manifest, keeping body and headers
    [[nodiscard]] virtual std::expected<ManifestResponse, std::error_code>
    fetch_manifest(const std::string& uri) = 0;

    // HEAD a segment
    [[nodiscard]] virtual std::expected<HeaderSet, std::error_code>
    fetch_segment_headers(const std::string& uri) = 0;

    // GET a segment, body read and dropped (fills intermediate caches)
    [[nodiscard]] virtual std::expected<HeaderSet, std::error_code>
    fetch_segment_full(const std::string& uri) = 0;
};

// libcurl-backed transport
class HttpTransport final : public Transport {
public:
    HttpTransport() = default;

    [[nodiscard]] std::expected<ManifestResponse, std::error_code>
    fetch_manifest(const std::string& uri) override;

    [[nodiscard]] std::expected<HeaderSet, std::error_code>
    fetch_segment_headers(const std::string& uri) override;

    [[nodiscard]] std::expected<HeaderSet, std::error_code>
    fetch_segment_full(const std::string& uri) override;

private:
    HttpSession session_;
};

} // namespace dashcheck::core
