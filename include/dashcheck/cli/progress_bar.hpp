// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

namespace dashcheck::cli {

// Segment counter bar drawn on stderr
class ProgressBar {
public:
    ProgressBar(std::size_t total, std::string_view label = {});
    ProgressBar(std::size_t total, std::string_view label, std::ostream& out);

    // Update progress
    void update(std::size_t completed, std::size_t failed = 0) noexcept;

    // Finish the progress bar
    void finish() noexcept;

    [[nodiscard]] std::string render(std::size_t completed, std::size_t failed) const;

private:
    [[nodiscard]] static std::string render_bar(double percent);

    std::size_t total_{0};
    std::size_t last_completed_{0};
    std::size_t last_failed_{0};
    std::string label_;
    std::ostream& out_;
    bool finished_{false};
};

// Spinner for indeterminate progress (live polling)
class Spinner {
public:
    explicit Spinner(std::ostream& out) noexcept;
    Spinner() noexcept;

    void update(std::string_view status = {}) noexcept;
    void clear() noexcept;

private:
    std::size_t frame_{0};
    std::ostream& out_;
};

} // namespace dashcheck::cli
