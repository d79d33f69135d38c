// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dashcheck/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace dashcheck::cli {

namespace {

const char* SPINNER_FRAMES[] = {"-", "\\", "|", "/"};

} // namespace

//=============================================================================
// Spinner
//=============================================================================

Spinner::Spinner(std::ostream& out) noexcept
    : out_(out) {}

Spinner::Spinner() noexcept
    : out_(std::cerr) {}

void Spinner::update(std::string_view status) noexcept {
    out_ << "\r" << SPINNER_FRAMES[frame_ % 4] << " " << status << std::flush;
    ++frame_;
}

void Spinner::clear() noexcept {
    out_ << "\r" << std::string(60, ' ') << "\r" << std::flush;
}

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::size_t total, std::string_view label)
    : ProgressBar(total, label, std::cerr) {}

ProgressBar::ProgressBar(std::size_t total, std::string_view label, std::ostream& out)
    : total_(total)
    , label_(label)
    , out_(out) {}

std::string ProgressBar::render(std::size_t completed, std::size_t failed) const {
    double percent = total_ == 0
        ? 100.0
        : static_cast<double>(completed) * 100.0 / static_cast<double>(total_);
    percent = std::clamp(percent, 0.0, 100.0);

    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }
    line += render_bar(percent);

    // Format percentage with padding
    const int pct_int = static_cast<int>(percent);
    line += " ";
    if (pct_int < 100) line += " ";
    if (pct_int < 10) line += " ";
    line += std::to_string(pct_int) + "%";

    line += " (";
    line += std::to_string(completed);
    line += "/";
    line += std::to_string(total_);
    line += ")";

    if (failed > 0) {
        line += " ";
        line += std::to_string(failed);
        line += " failed";
    }
    return line;
}

void ProgressBar::update(std::size_t completed, std::size_t failed) noexcept {
    if (total_ == 0 || finished_) return;
    if (completed == last_completed_ && failed == last_failed_ && completed != 0) return;

    last_completed_ = completed;
    last_failed_ = failed;

    // Clear rest of line
    out_ << "\r" << render(completed, failed) << std::string(10, ' ') << std::flush;
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    if (total_ > 0) {
        out_ << "\r" << render(total_, last_failed_) << std::string(10, ' ') << std::endl;
    }
    finished_ = true;
}

std::string ProgressBar::render_bar(double percent) {
    constexpr int bar_width = 30;
    const int filled = static_cast<int>(std::round(bar_width * percent / 100.0));
    const int empty = bar_width - filled;

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar += ">";
    bar.append(static_cast<std::size_t>(empty), ' ');
    bar += "]";
    return bar;
}

} // namespace dashcheck::cli
