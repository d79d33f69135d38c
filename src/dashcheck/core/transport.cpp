// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dashcheck/core/transport.hpp>

namespace dashcheck::core {

std::expected<ManifestResponse, std::error_code>
HttpTransport::fetch_manifest(const std::string& uri) {
    auto response = session_.get(uri, true);
    if (!response) {
        return std::unexpected(response.error());
    }
    return ManifestResponse{std::move(response->body), std::move(response->headers)};
}

std::expected<HeaderSet, std::error_code>
HttpTransport::fetch_segment_headers(const std::string& uri) {
    auto response = session_.head(uri);
    if (!response) {
        return std::unexpected(response.error());
    }
    return std::move(response->headers);
}

std::expected<HeaderSet, std::error_code>
HttpTransport::fetch_segment_full(const std::string& uri) {
    auto response = session_.get(uri, false);
    if (!response) {
        return std::unexpected(response.error());
    }
    return std::move(response->headers);
}

} // namespace dashcheck::core
