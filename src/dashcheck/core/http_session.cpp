// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dashcheck/core/http_session.hpp>
#include <dashcheck/core/config.hpp>
#include <dashcheck/core/log.hpp>
#include <curl/curl.h>
#include <cctype>
#include <exception>
#include <string>

namespace dashcheck::core {

namespace {

struct HeaderSink {
    HeaderSet* headers{nullptr};
};

struct BodySink {
    std::string* body{nullptr};    // nullptr: drop
};

std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* sink = static_cast<HeaderSink*>(userdata);
    if (!sink || !sink->headers) return total;

    try {
        parse_header_line(std::string_view(buffer, total), *sink->headers);
    } catch (const std::exception&) {
        return 0;  // Aborts the transfer with CURLE_WRITE_ERROR
    }
    return total;
}

std::size_t body_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* sink = static_cast<BodySink*>(userdata);
    if (!sink) return total;

    if (sink->body) {
        try {
            sink->body->append(ptr, total);
        } catch (const std::exception&) {
            return 0;
        }
    }
    return total;
}

std::error_code error_for_curl(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:      return make_error_code(ValidatorErrc::timeout);
        case CURLE_COULDNT_CONNECT:         return make_error_code(ValidatorErrc::refused);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:   return make_error_code(ValidatorErrc::dns_error);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:      return make_error_code(ValidatorErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:      return make_error_code(ValidatorErrc::too_many_redirects);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:    return make_error_code(ValidatorErrc::invalid_url);
        default:                            return make_error_code(ValidatorErrc::network_error);
    }
}

} // namespace

void parse_header_line(std::string_view line, HeaderSet& headers) {
    // New response in a redirect chain
    if (line.starts_with("HTTP/")) {
        headers.clear();
        return;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos) return;

    auto name = line.substr(0, colon);
    auto value = line.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' ||
                              value.back() == ' ' || value.back() == '\t')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower_name.empty()) return;

    auto it = headers.find(lower_name);
    if (it == headers.end()) {
        headers.emplace(std::move(lower_name), std::string(value));
    } else {
        // Repeated header, fold into a list
        it->second += ", ";
        it->second += value;
    }
}

std::error_code error_for_status(long http_code) noexcept {
    if (http_code < 400) return {};
    if (http_code == 404) return make_error_code(ValidatorErrc::not_found);
    if (http_code == 401 || http_code == 403) return make_error_code(ValidatorErrc::permission_denied);
    if (http_code >= 500) return make_error_code(ValidatorErrc::server_error);
    return make_error_code(ValidatorErrc::client_error);
}

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession() = default;

HttpSession::~HttpSession() {
    if (handle_) {
        curl_easy_cleanup(static_cast<CURL*>(handle_));
    }
}

HttpSession::HttpSession(HttpSession&& other) noexcept
    : handle_(other.handle_) {
    other.handle_ = nullptr;
}

HttpSession& HttpSession::operator=(HttpSession&& other) noexcept {
    if (this != &other) {
        if (handle_) curl_easy_cleanup(static_cast<CURL*>(handle_));
        handle_ = other.handle_;
        other.handle_ = nullptr;
    }
    return *this;
}

std::expected<HttpResponse, std::error_code>
HttpSession::head(const std::string& url) noexcept {
    return perform(url, true, false);
}

std::expected<HttpResponse, std::error_code>
HttpSession::get(const std::string& url, bool keep_body) noexcept {
    return perform(url, false, keep_body);
}

std::expected<HttpResponse, std::error_code>
HttpSession::perform(const std::string& url, bool no_body, bool keep_body) noexcept {
    if (!handle_) {
        handle_ = curl_easy_init();
        if (!handle_) {
            return std::unexpected(make_error_code(ValidatorErrc::network_error));
        }
    } else {
        curl_easy_reset(static_cast<CURL*>(handle_));
    }
    auto* curl = static_cast<CURL*>(handle_);

    HttpResponse response{};
    HeaderSink header_sink{&response.headers};
    BodySink body_sink{keep_body ? &response.body : nullptr};
    const std::string user_agent(USER_AGENT);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
    if (no_body) {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        // Decode gzip/deflate manifests transparently
        curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    }
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, FOLLOW_REDIRECTS ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(CONNECTION_TIMEOUT_SEC));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(REQUEST_TIMEOUT_SEC));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &header_sink);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, body_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body_sink);

    CURLcode result = curl_easy_perform(curl);
    if (result != CURLE_OK) {
        logger()->debug("{} {} failed: {}", no_body ? "HEAD" : "GET", url, curl_easy_strerror(result));
        return std::unexpected(error_for_curl(result));
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    logger()->debug("{} {} -> {}", no_body ? "HEAD" : "GET", url, http_code);

    if (auto ec = error_for_status(http_code)) {
        return std::unexpected(ec);
    }
    return response;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace dashcheck::core
