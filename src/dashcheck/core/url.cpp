// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dashcheck/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace dashcheck::core {

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    Url url;

    // Parse scheme
    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(ValidatorErrc::invalid_url));
    }

    std::string lower_scheme;
    lower_scheme.reserve(scheme_end);
    for (std::size_t i = 0; i < scheme_end; ++i) {
        lower_scheme += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
    }
    if (lower_scheme != "http" && lower_scheme != "https") {
        return std::unexpected(make_error_code(ValidatorErrc::invalid_url));
    }
    url.scheme_ = std::move(lower_scheme);

    auto rest_start = scheme_end + 3; // Skip "://"

    auto path_start = url_str.find('/', rest_start);
    if (path_start == std::string_view::npos) {
        path_start = url_str.length();
    }

    auto query_start = url_str.find('?', rest_start);
    if (query_start == std::string_view::npos) {
        query_start = url_str.length();
    }

    auto fragment_start = url_str.find('#', rest_start);
    if (fragment_start == std::string_view::npos) {
        fragment_start = url_str.length();
    }

    // host_end is at the first of: /, ?, #, or end
    auto host_end = std::min({path_start, query_start, fragment_start, url_str.length()});

    std::size_t authority_start = rest_start;

    // Skip userinfo (user:pass@host)
    auto at_pos = url_str.find('@', rest_start);
    if (at_pos != std::string_view::npos && at_pos < host_end) {
        authority_start = at_pos + 1;
    }

    auto bracket_start = url_str.find('[', authority_start);
    if (bracket_start != std::string_view::npos && bracket_start < host_end) {
        // IPv6 literal [::1]:port
        auto bracket_end = url_str.find(']', bracket_start);
        if (bracket_end == std::string_view::npos || bracket_end >= host_end) {
            return std::unexpected(make_error_code(ValidatorErrc::invalid_url));
        }
        url.host_ = std::string(url_str.substr(bracket_start, bracket_end - bracket_start + 1));
        if (bracket_end + 1 < host_end && url_str[bracket_end + 1] == ':') {
            url.port_ = std::string(url_str.substr(bracket_end + 2, host_end - bracket_end - 2));
        }
    } else {
        auto colon_pos = url_str.find(':', authority_start);
        if (colon_pos != std::string_view::npos && colon_pos < host_end) {
            url.host_ = std::string(url_str.substr(authority_start, colon_pos - authority_start));
            url.port_ = std::string(url_str.substr(colon_pos + 1, host_end - colon_pos - 1));
        } else {
            url.host_ = std::string(url_str.substr(authority_start, host_end - authority_start));
        }
    }

    if (!url.port_.empty() &&
        !std::all_of(url.port_.begin(), url.port_.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::unexpected(make_error_code(ValidatorErrc::invalid_url));
    }

    // Path runs until '?' or '#'
    if (host_end < url_str.length() && url_str[host_end] == '/') {
        auto path_end = std::min(query_start, fragment_start);
        url.path_ = std::string(url_str.substr(host_end, path_end - host_end));
    } else {
        url.path_ = "/";
    }

    if (query_start < url_str.length() && query_start < fragment_start) {
        url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
    }

    if (fragment_start < url_str.length()) {
        url.fragment_ = std::string(url_str.substr(fragment_start + 1));
    }

    if (url.host_.empty()) {
        return std::unexpected(make_error_code(ValidatorErrc::invalid_url));
    }

    return url;
}

std::string Url::origin() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::string Url::directory() const {
    auto last_slash = path_.rfind('/');
    if (last_slash == std::string::npos) {
        return origin() + "/";
    }
    return origin() + path_.substr(0, last_slash + 1);
}

std::expected<std::string, std::error_code>
resolve_base_url(std::string_view uri) noexcept {
    auto url = Url::parse(uri);
    if (!url) {
        return std::unexpected(url.error());
    }
    return url->directory();
}

bool is_absolute_url(std::string_view uri) noexcept {
    return uri.starts_with("http://") || uri.starts_with("https://");
}

std::string resolve_url(std::string_view base, std::string_view relative) {
    if (is_absolute_url(relative) || base.empty()) {
        return std::string(relative);
    }

    if (relative.starts_with("/")) {
        // Origin-relative path
        auto parsed = Url::parse(base);
        if (parsed) {
            return parsed->origin() + std::string(relative);
        }
    }

    std::string result(base);
    if (!result.ends_with('/')) {
        result += '/';
    }
    result += relative;
    return result;
}

} // namespace dashcheck::core
