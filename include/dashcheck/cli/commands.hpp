// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dashcheck/cli/report.hpp>
#include <dashcheck/core/config.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace dashcheck::cli {

// Process exit codes
constexpr int EXIT_PASS = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_VIOLATION = 2;

// CLI result, value is the exit code
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::vector<std::string> urls;
    bool verify_all{false};
    std::optional<std::size_t> spotcheck;
    std::optional<std::uint32_t> live_iterations;
    bool full_download{false};
    bool json{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    core::ValidatorConfig config;
};

// Parse command line arguments, the error is a message for the user
[[nodiscard]] std::expected<CliArgs, std::string> parse_args(int argc, char* argv[]);

// Validate one manifest URL according to args
[[nodiscard]] CliResult validate(const std::string& url, const CliArgs& args) noexcept;

// Exit code for a finished report: incomplete live runs are errors
[[nodiscard]] int exit_code(const ValidationReport& report) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace dashcheck::cli
