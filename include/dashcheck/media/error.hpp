// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace dashcheck::media {

enum class ParseErrc {
    success = 0,
    malformed_xml,
    missing_mpd,
    invalid_type,
    invalid_duration,
    invalid_datetime,
    missing_availability_start,
    invalid_segment_template,
};

namespace detail {

struct ParseErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "dashcheck::media";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<ParseErrc>(ev)) {
            case ParseErrc::success:                     return "Success";
            case ParseErrc::malformed_xml:               return "Malformed XML";
            case ParseErrc::missing_mpd:                 return "Missing MPD root element";
            case ParseErrc::invalid_type:                return "Invalid MPD@type";
            case ParseErrc::invalid_duration:            return "Invalid ISO 8601 duration";
            case ParseErrc::invalid_datetime:            return "Invalid ISO 8601 date time";
            case ParseErrc::missing_availability_start:  return "Dynamic MPD without availabilityStartTime";
            case ParseErrc::invalid_segment_template:    return "Invalid SegmentTemplate";
            default:                                     return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::ParseErrcCategory& parse_errc_category() noexcept {
    static detail::ParseErrcCategory category;
    return category;
}

inline std::error_code make_error_code(ParseErrc e) noexcept {
    return {static_cast<int>(e), parse_errc_category()};
}

} // namespace dashcheck::media

namespace std {

template<>
struct is_error_code_enum<dashcheck::media::ParseErrc> : true_type {};

} // namespace std
