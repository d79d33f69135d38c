// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dashcheck/cli/commands.hpp>
#include <dashcheck/cli/progress_bar.hpp>
#include <dashcheck/cli/report.hpp>
#include <dashcheck/core/http_session.hpp>
#include <dashcheck/core/log.hpp>
#include <dashcheck/core/validator.hpp>
#include <dashcheck/version.hpp>
#include <charconv>
#include <iostream>
#include <memory>

namespace dashcheck::cli {

namespace {

template<typename T>
std::optional<T> parse_number(std::string_view text) noexcept {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

// RAII curl global init/cleanup around a command
struct HttpScope {
    HttpScope() noexcept { core::HttpSession::global_init(); }
    ~HttpScope() { core::HttpSession::global_cleanup(); }
    HttpScope(const HttpScope&) = delete;
    HttpScope& operator=(const HttpScope&) = delete;
};

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

std::expected<CliArgs, std::string> parse_args(int argc, char* argv[]) {
    CliArgs args;

    // Fetch the value following an option
    auto value_of = [&](int& i, std::string_view option) -> std::expected<std::string_view, std::string> {
        if (i + 1 >= argc) {
            return std::unexpected("Missing value for " + std::string(option));
        }
        return std::string_view(argv[++i]);
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "--json") {
            args.json = true;
        } else if (arg == "-a" || arg == "--all") {
            args.verify_all = true;
        } else if (arg == "-d" || arg == "--download") {
            args.full_download = true;
        } else if (arg == "-s" || arg == "--spotcheck") {
            auto value = value_of(i, arg);
            if (!value) return std::unexpected(value.error());
            auto count = parse_number<std::size_t>(*value);
            if (!count) return std::unexpected("Invalid sample count: " + std::string(*value));
            args.spotcheck = *count;
        } else if (arg == "-l" || arg == "--live") {
            auto value = value_of(i, arg);
            if (!value) return std::unexpected(value.error());
            auto iterations = parse_number<std::uint32_t>(*value);
            if (!iterations) return std::unexpected("Invalid iteration count: " + std::string(*value));
            args.live_iterations = *iterations;
        } else if (arg == "--drift" || arg == "--delay" || arg == "--interval") {
            auto value = value_of(i, arg);
            if (!value) return std::unexpected(value.error());
            auto ms = parse_number<std::int64_t>(*value);
            if (!ms || *ms < 0) return std::unexpected("Invalid milliseconds for " + std::string(arg));
            const std::chrono::milliseconds duration{*ms};
            if (arg == "--drift") {
                args.config.allowed_drift = duration;
            } else if (arg == "--delay") {
                args.config.probe_delay = duration;
            } else {
                args.config.poll_interval = duration;
            }
        } else if (arg == "--seed") {
            auto value = value_of(i, arg);
            if (!value) return std::unexpected(value.error());
            auto seed = parse_number<std::uint64_t>(*value);
            if (!seed) return std::unexpected("Invalid seed: " + std::string(*value));
            args.config.seed = *seed;
        } else if (arg.starts_with("http://") || arg.starts_with("https://")) {
            args.urls.emplace_back(arg);
        } else {
            return std::unexpected("Unknown argument: " + std::string(arg));
        }
    }

    if (args.verify_all && args.spotcheck) {
        return std::unexpected(std::string("--all and --spotcheck are mutually exclusive"));
    }
    return args;
}

//=============================================================================
// Commands
//=============================================================================

CliResult validate(const std::string& url, const CliArgs& args) noexcept {
    HttpScope http;
    const bool show_progress = !args.quiet && !args.json;

    core::Validator validator(url, args.config);
    if (auto ec = validator.load()) {
        std::cerr << "Error: " << url << ": " << ec.message() << std::endl;
        return std::unexpected(ec);
    }

    auto manifest = validator.manifest();
    ValidationReport report;
    report.url = url;
    report.type = manifest->type();
    report.duration_seconds = manifest->total_duration().count();
    report.segment_count = manifest->segments().size();

    auto manifest_check = validator.verify_manifest();
    if (!manifest_check) return std::unexpected(manifest_check.error());
    report.manifest_check = std::move(*manifest_check);

    auto timestamps = validator.verify_timestamps(args.config.allowed_drift);
    if (!timestamps) return std::unexpected(timestamps.error());
    report.timestamps = *timestamps;

    if (args.verify_all || args.spotcheck) {
        const std::size_t total = args.verify_all ? report.segment_count : *args.spotcheck;
        ProgressBar bar(total, "Verifying segments");
        if (show_progress) {
            validator.segment_callback([&bar](const core::VerifyProgress& p) {
                bar.update(p.completed, p.failed);
            });
        }

        auto segments = args.verify_all
            ? validator.verify_all_segments({}, args.full_download)
            : validator.spotcheck_segments({}, *args.spotcheck, args.full_download);
        if (show_progress) bar.finish();
        if (!segments) return std::unexpected(segments.error());
        report.segments = std::move(*segments);
    }

    if (args.live_iterations) {
        if (!manifest->is_live()) {
            core::logger()->warn("{} is a static manifest, skipping live validation", url);
        } else {
            // Violations are logged by the runner, the spinner only tracks iterations
            auto spinner = std::make_shared<Spinner>();
            if (show_progress) {
                validator.on("checking", [spinner, total = *args.live_iterations](const core::RunnerEventData& e) {
                    const auto& checking = std::get<core::CheckingEvent>(e);
                    spinner->update("iteration " + std::to_string(checking.iteration) + "/" + std::to_string(total));
                });
            }

            auto summary = validator.validate_dynamic_manifest(*args.live_iterations);
            if (show_progress) spinner->clear();
            if (!summary) return std::unexpected(summary.error());
            report.live = std::move(*summary);
        }
    }

    if (args.json) {
        std::cout << report_json(report).dump(2) << std::endl;
    } else {
        std::cout << render_text(report);
    }

    return exit_code(report);
}

int exit_code(const ValidationReport& report) noexcept {
    if (!report.complete()) return EXIT_ERROR;
    return report.passed() ? EXIT_PASS : EXIT_VIOLATION;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "dashcheck " << dashcheck::version.to_string() << " - MPEG-DASH delivery validator\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <MPD URL>...\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable debug logging\n";
    std::cout << "  -q, --quiet             Only log errors, no progress output\n";
    std::cout << "      --json              Print the report as JSON\n";
    std::cout << "  -a, --all               Verify every segment\n";
    std::cout << "  -s, --spotcheck <N>     Verify N randomly sampled segments\n";
    std::cout << "  -d, --download          Use GET instead of HEAD for segments\n";
    std::cout << "  -l, --live <N>          Poll a live manifest N times\n";
    std::cout << "      --drift <MS>        Allowed live-edge drift (default: 10000)\n";
    std::cout << "      --delay <MS>        Delay between segment requests (default: 50)\n";
    std::cout << "      --interval <MS>     Delay between live refreshes (default: 2000)\n";
    std::cout << "      --seed <N>          Seed for --spotcheck sampling\n";
    std::cout << "\n";
    std::cout << "EXIT CODES:\n";
    std::cout << "  0  all checks passed\n";
    std::cout << "  1  usage, network or parse error, including failed live refreshes\n";
    std::cout << "  2  policy or timing violation\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/vod/manifest.mpd\n";
    std::cout << "  " << program_name << " -s 20 -d https://example.com/vod/manifest.mpd\n";
    std::cout << "  " << program_name << " -l 10 --json https://example.com/live/manifest.mpd\n";
}

void print_version() noexcept {
    std::cout << "dashcheck " << dashcheck::version.to_string() << std::endl;
    std::cout << "Built with C++23, libcurl, libxml2, spdlog, nlohmann/json\n";
}

} // namespace dashcheck::cli
