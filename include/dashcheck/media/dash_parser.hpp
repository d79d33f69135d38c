// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dashcheck/media/error.hpp>
#include <dashcheck/media/manifest.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace dashcheck::media {

// Upper bound on segments generated for one representation
constexpr std::size_t MAX_SEGMENTS_PER_REPRESENTATION = 100'000;

// DASH MPD parser. Produces the flat segment list of every representation
// (initialization first, then media in presentation order) plus the live
// edge for dynamic presentations.
class DASHParser {
public:
    // `now` decides which segments a dynamic SegmentTemplate@duration exposes
    [[nodiscard]] static std::expected<Manifest, std::error_code>
    parse(std::string_view content, WallClock::time_point now = WallClock::now()) noexcept;

    // ISO 8601 duration, e.g. "PT1H2M3.5S"
    [[nodiscard]] static std::expected<Seconds, std::error_code>
    parse_duration(std::string_view value) noexcept;

    // ISO 8601 date time in UTC or with a numeric offset
    [[nodiscard]] static std::expected<WallClock::time_point, std::error_code>
    parse_datetime(std::string_view value) noexcept;

    // Substitute $RepresentationID$, $Number$, $Time$, $Bandwidth$ and $$
    [[nodiscard]] static std::string expand_template(std::string_view tmpl,
                                                     std::string_view representation_id,
                                                     std::uint64_t bandwidth,
                                                     std::uint64_t number,
                                                     std::uint64_t time);
};

} // namespace dashcheck::media
