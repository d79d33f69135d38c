// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace dashcheck::media {

enum class PresentationType : std::uint8_t {
    static_,    // VOD
    dynamic     // Live
};

[[nodiscard]] constexpr std::string_view to_string(PresentationType type) noexcept {
    return type == PresentationType::dynamic ? "dynamic" : "static";
}

using WallClock = std::chrono::system_clock;
using Seconds = std::chrono::duration<double>;

struct StaticTiming {};

// Live-edge information, only present on dynamic manifests
struct DynamicTiming {
    WallClock::time_point time_at_head;
    WallClock::time_point availability_start_time;
    std::optional<std::chrono::milliseconds> minimum_update_period;
};

using PresentationTiming = std::variant<StaticTiming, DynamicTiming>;

// Parsed MPD, immutable once constructed
class Manifest {
public:
    Manifest(Seconds total_duration,
             std::vector<std::string> segments,
             PresentationTiming timing)
        : total_duration_(total_duration < Seconds::zero() ? Seconds::zero() : total_duration)
        , segments_(std::move(segments))
        , timing_(std::move(timing)) {}

    [[nodiscard]] static Manifest make_static(Seconds total_duration,
                                              std::vector<std::string> segments) {
        return Manifest(total_duration, std::move(segments), StaticTiming{});
    }

    [[nodiscard]] static Manifest make_dynamic(Seconds total_duration,
                                               std::vector<std::string> segments,
                                               DynamicTiming timing) {
        return Manifest(total_duration, std::move(segments), timing);
    }

    [[nodiscard]] PresentationType type() const noexcept {
        return std::holds_alternative<DynamicTiming>(timing_)
            ? PresentationType::dynamic
            : PresentationType::static_;
    }

    [[nodiscard]] bool is_live() const noexcept { return type() == PresentationType::dynamic; }

    [[nodiscard]] Seconds total_duration() const noexcept { return total_duration_; }
    [[nodiscard]] const std::vector<std::string>& segments() const noexcept { return segments_; }
    [[nodiscard]] const PresentationTiming& timing() const noexcept { return timing_; }

    // nullptr for static manifests
    [[nodiscard]] const DynamicTiming* live() const noexcept { return std::get_if<DynamicTiming>(&timing_); }

    [[nodiscard]] std::optional<WallClock::time_point> time_at_head() const noexcept {
        if (const auto* l = live()) return l->time_at_head;
        return std::nullopt;
    }

private:
    Seconds total_duration_;
    std::vector<std::string> segments_;
    PresentationTiming timing_;
};

} // namespace dashcheck::media
