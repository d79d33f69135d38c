// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dashcheck/cli/commands.hpp>
#include <dashcheck/core/log.hpp>
#include <iostream>
#include <exception>
#include <cstdlib>

using namespace dashcheck::cli;

// Terminate handler to report exceptions escaping noexcept functions
static void dashcheck_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    try {
        std::rethrow_exception(std::current_exception());
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
    } catch (...) {
        std::cerr << "Unknown exception in noexcept context" << std::endl;
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(dashcheck_terminate_handler);

    auto args = parse_args(argc, argv);
    if (!args) {
        std::cerr << "Error: " << args.error() << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return EXIT_ERROR;
    }

    if (args->help) {
        print_help(argv[0]);
        return EXIT_PASS;
    }

    if (args->version) {
        print_version();
        return EXIT_PASS;
    }

    if (args->urls.empty()) {
        std::cerr << "Error: No manifest URL specified" << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return EXIT_ERROR;
    }

    if (args->verbose) {
        dashcheck::core::set_log_level(spdlog::level::debug);
    } else if (args->quiet) {
        dashcheck::core::set_log_level(spdlog::level::err);
    }

    // Errors outrank violations
    int status = EXIT_PASS;
    for (const auto& url : args->urls) {
        auto result = validate(url, *args);
        const int code = result ? *result : EXIT_ERROR;
        if (code == EXIT_ERROR || status == EXIT_PASS) {
            status = code;
        }
    }

    return status;
}
