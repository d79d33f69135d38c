// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dashcheck/core/error.hpp>
#include <string>
#include <string_view>
#include <expected>

namespace dashcheck::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }
    [[nodiscard]] std::string_view query() const noexcept { return query_; }
    [[nodiscard]] std::string_view fragment() const noexcept { return fragment_; }

    [[nodiscard]] std::string origin() const;     // scheme://host[:port]
    [[nodiscard]] std::string directory() const;  // origin + path up to the last '/'

    Url() = default;

private:
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

// Directory of a manifest URI, always ending with '/'
[[nodiscard]] std::expected<std::string, std::error_code>
resolve_base_url(std::string_view uri) noexcept;

// Join a manifest-relative reference to a base URL
[[nodiscard]] std::string resolve_url(std::string_view base, std::string_view relative);

[[nodiscard]] bool is_absolute_url(std::string_view uri) noexcept;

} // namespace dashcheck::core
