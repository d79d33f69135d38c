// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace dashcheck::core {

enum class ValidatorErrc {
    success = 0,
    network_error,
    timeout,
    refused,
    dns_error,
    ssl_error,
    too_many_redirects,
    not_found,
    permission_denied,
    client_error,
    server_error,
    invalid_url,
    not_loaded,
    already_running,
    runner_stopped,
    invalid_argument,
};

namespace detail {

struct ValidatorErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "dashcheck::core";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<ValidatorErrc>(ev)) {
            case ValidatorErrc::success:             return "Success";
            case ValidatorErrc::network_error:       return "Network error";
            case ValidatorErrc::timeout:             return "Operation timed out";
            case ValidatorErrc::refused:             return "Connection refused";
            case ValidatorErrc::dns_error:           return "DNS resolution failed";
            case ValidatorErrc::ssl_error:           return "SSL/TLS error";
            case ValidatorErrc::too_many_redirects:  return "Too many redirects";
            case ValidatorErrc::not_found:           return "Resource not found (404)";
            case ValidatorErrc::permission_denied:   return "Access denied (401/403)";
            case ValidatorErrc::client_error:        return "Client error (4xx)";
            case ValidatorErrc::server_error:        return "Server error (5xx)";
            case ValidatorErrc::invalid_url:         return "Invalid URL";
            case ValidatorErrc::not_loaded:          return "Manifest not loaded";
            case ValidatorErrc::already_running:     return "Runner already running";
            case ValidatorErrc::runner_stopped:      return "Runner already stopped";
            case ValidatorErrc::invalid_argument:    return "Invalid argument";
            default:                                 return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::ValidatorErrcCategory& validator_errc_category() noexcept {
    static detail::ValidatorErrcCategory category;
    return category;
}

inline std::error_code make_error_code(ValidatorErrc e) noexcept {
    return {static_cast<int>(e), validator_errc_category()};
}

} // namespace dashcheck::core

namespace std {

template<>
struct is_error_code_enum<dashcheck::core::ValidatorErrc> : true_type {};

} // namespace std
