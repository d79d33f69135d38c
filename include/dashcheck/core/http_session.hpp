// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dashcheck/core/error.hpp>
#include <string>
#include <string_view>
#include <expected>
#include <map>

namespace dashcheck::core {

// Response headers keyed by lower-cased name
using HeaderSet = std::map<std::string, std::string>;

struct HttpResponse {
    HeaderSet headers;
    std::string body;               // Only filled by get(url, true)
};

class HttpSession {
public:
    HttpSession();
    ~HttpSession();

    // Non-copyable, movable
    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;
    HttpSession(HttpSession&&) noexcept;
    HttpSession& operator=(HttpSession&&) noexcept;

    // Perform HEAD request
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept;

    // Perform GET request, the body is always read to the end
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    get(const std::string& url, bool keep_body) noexcept;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    perform(const std::string& url, bool no_body, bool keep_body) noexcept;

    void* handle_{nullptr}; // CURL*, reused between requests
};

// Fold one raw header line into a HeaderSet. A status line resets the set so
// that only the final response of a redirect chain is kept.
void parse_header_line(std::string_view line, HeaderSet& headers);

// Map an HTTP status to an error, empty for 1xx-3xx
[[nodiscard]] std::error_code error_for_status(long http_code) noexcept;

} // namespace dashcheck::core
