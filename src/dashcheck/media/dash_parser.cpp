// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dashcheck/media/dash_parser.hpp>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <climits>
#include <cmath>
#include <exception>
#include <memory>
#include <optional>
#include <vector>

namespace dashcheck::media {

namespace {

// Longest duration or offset accepted, well inside the nanosecond clock range
constexpr double MAX_MEDIA_SECONDS = 100.0 * 365.0 * 86400.0;

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const noexcept { xmlFreeDoc(doc); }
};
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

struct TimelineEntry {
    std::optional<std::uint64_t> t;
    std::uint64_t d{0};
    std::int64_t r{0};
};

struct SegmentTemplateInfo {
    std::optional<std::string> media;
    std::optional<std::string> initialization;
    std::uint64_t start_number{1};
    std::uint64_t timescale{1};
    std::optional<std::uint64_t> duration;
    std::uint64_t presentation_time_offset{0};
    std::optional<std::vector<TimelineEntry>> timeline;
};

struct SegmentListInfo {
    std::optional<std::string> initialization;
    std::vector<std::string> media;
    std::uint64_t timescale{1};
    std::optional<std::uint64_t> duration;
};

struct PeriodContext {
    PresentationType type{PresentationType::static_};
    WallClock::time_point now;
    std::optional<WallClock::time_point> availability_start;
    std::optional<Seconds> time_shift_buffer_depth;
    Seconds period_start{0};
    std::optional<Seconds> period_duration;
};

// Period-relative media range covered by one representation
struct RepresentationSegments {
    std::vector<std::string> uris;
    Seconds media_start{0};
    std::optional<Seconds> media_end;
};

//=============================================================================
// libxml2 helpers
//=============================================================================

bool is_element(const xmlNode* node, std::string_view name) noexcept {
    return node && node->type == XML_ELEMENT_NODE &&
           std::string_view(reinterpret_cast<const char*>(node->name)) == name;
}

std::vector<const xmlNode*> children(const xmlNode* node, std::string_view name) {
    std::vector<const xmlNode*> out;
    for (const xmlNode* c = node->children; c; c = c->next) {
        if (is_element(c, name)) out.push_back(c);
    }
    return out;
}

const xmlNode* first_child(const xmlNode* node, std::string_view name) noexcept {
    for (const xmlNode* c = node->children; c; c = c->next) {
        if (is_element(c, name)) return c;
    }
    return nullptr;
}

std::optional<std::string> attribute(const xmlNode* node, const char* name) {
    xmlChar* value = xmlGetProp(node, reinterpret_cast<const xmlChar*>(name));
    if (!value) return std::nullopt;
    std::string result(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return result;
}

std::string text_content(const xmlNode* node) {
    xmlChar* value = xmlNodeGetContent(node);
    if (!value) return {};
    std::string result(reinterpret_cast<const char*>(value));
    xmlFree(value);

    auto not_space = [](unsigned char c) { return std::isspace(c) == 0; };
    result.erase(result.begin(), std::find_if(result.begin(), result.end(), not_space));
    result.erase(std::find_if(result.rbegin(), result.rend(), not_space).base(), result.end());
    return result;
}

template<typename T>
std::optional<T> to_integer(std::string_view text) noexcept {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

// Present-but-invalid attributes are an error, absent ones keep the default
template<typename T>
std::error_code read_integer(const xmlNode* node, const char* name, T& out) {
    auto raw = attribute(node, name);
    if (!raw) return {};
    auto value = to_integer<T>(*raw);
    if (!value) return make_error_code(ParseErrc::invalid_segment_template);
    out = *value;
    return {};
}

std::expected<std::optional<Seconds>, std::error_code>
duration_attribute(const xmlNode* node, const char* name) {
    auto raw = attribute(node, name);
    if (!raw) return std::optional<Seconds>{};
    auto parsed = DASHParser::parse_duration(*raw);
    if (!parsed) return std::unexpected(parsed.error());
    return std::optional<Seconds>{*parsed};
}

//=============================================================================
// Addressing
//=============================================================================

std::string join_base(const std::string& base, std::string_view next) {
    if (next.starts_with("http://") || next.starts_with("https://") || base.empty()) {
        return std::string(next);
    }
    if (base.ends_with('/')) {
        return base + std::string(next);
    }
    auto last_slash = base.rfind('/');
    if (last_slash == std::string::npos) {
        return std::string(next);
    }
    return base.substr(0, last_slash + 1) + std::string(next);
}

std::string child_base(const std::string& parent, const xmlNode* node) {
    const xmlNode* base_node = first_child(node, "BaseURL");
    if (!base_node) return parent;
    auto value = text_content(base_node);
    if (value.empty()) return parent;
    return join_base(parent, value);
}

std::expected<SegmentTemplateInfo, std::error_code>
read_template(const xmlNode* node, SegmentTemplateInfo info) {
    if (auto media = attribute(node, "media")) info.media = std::move(media);
    if (auto init = attribute(node, "initialization")) info.initialization = std::move(init);

    if (auto ec = read_integer(node, "startNumber", info.start_number)) return std::unexpected(ec);
    if (auto ec = read_integer(node, "timescale", info.timescale)) return std::unexpected(ec);
    if (auto ec = read_integer(node, "presentationTimeOffset", info.presentation_time_offset)) {
        return std::unexpected(ec);
    }
    if (attribute(node, "duration")) {
        std::uint64_t duration = 0;
        if (auto ec = read_integer(node, "duration", duration)) return std::unexpected(ec);
        info.duration = duration;
    }
    if (info.timescale == 0) {
        return std::unexpected(make_error_code(ParseErrc::invalid_segment_template));
    }

    if (const xmlNode* timeline = first_child(node, "SegmentTimeline")) {
        std::vector<TimelineEntry> entries;
        for (const xmlNode* s : children(timeline, "S")) {
            TimelineEntry entry;
            if (attribute(s, "t")) {
                std::uint64_t t = 0;
                if (auto ec = read_integer(s, "t", t)) return std::unexpected(ec);
                entry.t = t;
            }
            if (auto ec = read_integer(s, "d", entry.d)) return std::unexpected(ec);
            if (auto ec = read_integer(s, "r", entry.r)) return std::unexpected(ec);
            entries.push_back(entry);
        }
        info.timeline = std::move(entries);
    }
    return info;
}

std::expected<SegmentListInfo, std::error_code>
read_list(const xmlNode* node, SegmentListInfo info) {
    if (auto ec = read_integer(node, "timescale", info.timescale)) return std::unexpected(ec);
    if (attribute(node, "duration")) {
        std::uint64_t duration = 0;
        if (auto ec = read_integer(node, "duration", duration)) return std::unexpected(ec);
        info.duration = duration;
    }
    if (info.timescale == 0) {
        return std::unexpected(make_error_code(ParseErrc::invalid_segment_template));
    }
    if (const xmlNode* init = first_child(node, "Initialization")) {
        if (auto src = attribute(init, "sourceURL")) info.initialization = std::move(src);
    }
    auto urls = children(node, "SegmentURL");
    if (!urls.empty()) {
        info.media.clear();
        for (const xmlNode* url : urls) {
            if (auto media = attribute(url, "media")) info.media.push_back(std::move(*media));
        }
    }
    return info;
}

// Whole segments of `segment_seconds` fitting in `span`, saturating at 2^53
std::uint64_t segment_index(double span, double segment_seconds, bool round_up) noexcept {
    constexpr double limit = 9007199254740992.0;
    if (!(span > 0.0) || !(segment_seconds > 0.0)) {
        return 0;
    }
    const double quotient = span / segment_seconds;
    const double count = round_up ? std::ceil(quotient) : std::floor(quotient);
    if (!std::isfinite(count) || count >= limit) {
        return static_cast<std::uint64_t>(limit);
    }
    return static_cast<std::uint64_t>(count);
}

std::expected<RepresentationSegments, std::error_code>
template_segments(const SegmentTemplateInfo& tpl,
                  std::string_view rep_id,
                  std::uint64_t bandwidth,
                  const std::string& base,
                  const PeriodContext& ctx) {
    RepresentationSegments out;
    if (tpl.initialization) {
        out.uris.push_back(join_base(base, DASHParser::expand_template(*tpl.initialization, rep_id, bandwidth, 0, 0)));
    }
    if (!tpl.media) return out;

    const auto timescale = static_cast<double>(tpl.timescale);
    const auto pto = static_cast<double>(tpl.presentation_time_offset);

    if (tpl.timeline) {
        std::uint64_t time = 0;
        std::uint64_t number = tpl.start_number;
        std::size_t generated = 0;
        bool first = true;
        for (const auto& entry : *tpl.timeline) {
            if (entry.t) time = *entry.t;
            if (first) {
                out.media_start = Seconds((static_cast<double>(time) - pto) / timescale);
                first = false;
            }
            // r=-1 (repeat to the next S or period end) counts as a single segment
            const std::int64_t repeats = std::max<std::int64_t>(entry.r, 0);
            for (std::int64_t i = 0; i <= repeats && generated < MAX_SEGMENTS_PER_REPRESENTATION; ++i) {
                out.uris.push_back(join_base(base, DASHParser::expand_template(*tpl.media, rep_id, bandwidth, number, time)));
                time += entry.d;
                ++number;
                ++generated;
            }
        }
        if (!first) {
            out.media_end = Seconds((static_cast<double>(time) - pto) / timescale);
        }
        return out;
    }

    if (!tpl.duration || *tpl.duration == 0) {
        return std::unexpected(make_error_code(ParseErrc::invalid_segment_template));
    }

    const double segment_seconds = static_cast<double>(*tpl.duration) / timescale;
    std::uint64_t first_index = 0;
    std::uint64_t end_index = 0;

    if (ctx.type == PresentationType::static_) {
        if (ctx.period_duration) {
            end_index = std::min<std::uint64_t>(
                segment_index(ctx.period_duration->count(), segment_seconds, true),
                MAX_SEGMENTS_PER_REPRESENTATION);
        }
    } else {
        const auto period_origin = *ctx.availability_start +
            std::chrono::duration_cast<WallClock::duration>(ctx.period_start);
        const double elapsed = Seconds(ctx.now - period_origin).count();
        end_index = segment_index(elapsed, segment_seconds, false);
        if (ctx.time_shift_buffer_depth) {
            first_index = segment_index(elapsed - ctx.time_shift_buffer_depth->count(), segment_seconds, false);
        }
        if (ctx.period_duration) {
            end_index = std::min(end_index, segment_index(ctx.period_duration->count(), segment_seconds, true));
        }
        first_index = std::min(first_index, end_index);
    }

    if (end_index - first_index > MAX_SEGMENTS_PER_REPRESENTATION) {
        first_index = end_index - MAX_SEGMENTS_PER_REPRESENTATION;
    }

    for (std::uint64_t index = first_index; index < end_index; ++index) {
        const std::uint64_t number = tpl.start_number + index;
        const std::uint64_t time = index * *tpl.duration + tpl.presentation_time_offset;
        out.uris.push_back(join_base(base, DASHParser::expand_template(*tpl.media, rep_id, bandwidth, number, time)));
    }
    if (end_index > first_index) {
        out.media_start = Seconds(static_cast<double>(first_index) * segment_seconds);
        out.media_end = Seconds(static_cast<double>(end_index) * segment_seconds);
    }
    return out;
}

RepresentationSegments list_segments(const SegmentListInfo& list, const std::string& base) {
    RepresentationSegments out;
    if (list.initialization) {
        out.uris.push_back(join_base(base, *list.initialization));
    }
    for (const auto& media : list.media) {
        out.uris.push_back(join_base(base, media));
    }
    if (list.duration && !list.media.empty()) {
        out.media_end = Seconds(static_cast<double>(list.media.size()) *
                                static_cast<double>(*list.duration) /
                                static_cast<double>(list.timescale));
    }
    return out;
}

std::string format_number(std::uint64_t value, std::string_view format) {
    std::string digits = std::to_string(value);
    // Only %0<width>d is defined for DASH identifiers
    if (format.size() >= 3 && format.front() == '%' && format.back() == 'd') {
        auto width_text = format.substr(1, format.size() - 2);
        if (auto width = to_integer<std::size_t>(width_text); width && *width > digits.size()) {
            digits.insert(0, *width - digits.size(), '0');
        }
    }
    return digits;
}

//=============================================================================
// Document walk
//=============================================================================

std::expected<Manifest, std::error_code>
parse_document(std::string_view content, WallClock::time_point now) {
    if (content.size() > static_cast<std::size_t>(INT_MAX)) {
        return std::unexpected(make_error_code(ParseErrc::malformed_xml));
    }

    xmlInitParser();
    XmlDocPtr doc(xmlReadMemory(content.data(), static_cast<int>(content.size()),
                                "manifest.mpd", nullptr,
                                XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc) {
        return std::unexpected(make_error_code(ParseErrc::malformed_xml));
    }

    const xmlNode* mpd = xmlDocGetRootElement(doc.get());
    if (!is_element(mpd, "MPD")) {
        return std::unexpected(make_error_code(ParseErrc::missing_mpd));
    }

    PeriodContext ctx;
    ctx.now = now;

    auto type = attribute(mpd, "type");
    if (!type || *type == "static") {
        ctx.type = PresentationType::static_;
    } else if (*type == "dynamic") {
        ctx.type = PresentationType::dynamic;
    } else {
        return std::unexpected(make_error_code(ParseErrc::invalid_type));
    }

    auto mpd_duration = duration_attribute(mpd, "mediaPresentationDuration");
    if (!mpd_duration) return std::unexpected(mpd_duration.error());

    auto min_update = duration_attribute(mpd, "minimumUpdatePeriod");
    if (!min_update) return std::unexpected(min_update.error());

    auto tsbd = duration_attribute(mpd, "timeShiftBufferDepth");
    if (!tsbd) return std::unexpected(tsbd.error());
    ctx.time_shift_buffer_depth = *tsbd;

    if (auto ast = attribute(mpd, "availabilityStartTime")) {
        auto parsed = DASHParser::parse_datetime(*ast);
        if (!parsed) return std::unexpected(parsed.error());
        ctx.availability_start = *parsed;
    }
    if (ctx.type == PresentationType::dynamic && !ctx.availability_start) {
        return std::unexpected(make_error_code(ParseErrc::missing_availability_start));
    }

    const std::string mpd_base = child_base({}, mpd);
    std::vector<std::string> segments;
    std::optional<Seconds> head;          // Period-start-relative live edge
    Seconds covered{0};
    std::optional<Seconds> previous_end{Seconds{0}};

    for (const xmlNode* period : children(mpd, "Period")) {
        auto start = duration_attribute(period, "start");
        if (!start) return std::unexpected(start.error());
        auto duration = duration_attribute(period, "duration");
        if (!duration) return std::unexpected(duration.error());

        ctx.period_start = start->value_or(previous_end.value_or(Seconds{0}));
        if (ctx.period_start.count() > MAX_MEDIA_SECONDS) {
            return std::unexpected(make_error_code(ParseErrc::invalid_duration));
        }
        ctx.period_duration = *duration;
        if (!ctx.period_duration && *mpd_duration) {
            // A period starting past the presentation end has nothing left
            ctx.period_duration = std::max(**mpd_duration - ctx.period_start, Seconds{0});
        }
        previous_end = ctx.period_duration
            ? std::optional<Seconds>(ctx.period_start + *ctx.period_duration)
            : std::nullopt;

        const std::string period_base = child_base(mpd_base, period);
        SegmentTemplateInfo period_template;
        if (const xmlNode* node = first_child(period, "SegmentTemplate")) {
            auto tpl = read_template(node, period_template);
            if (!tpl) return std::unexpected(tpl.error());
            period_template = std::move(*tpl);
        }

        std::optional<Seconds> period_head;
        for (const xmlNode* adaptation : children(period, "AdaptationSet")) {
            const std::string as_base = child_base(period_base, adaptation);

            std::optional<SegmentTemplateInfo> as_template;
            if (first_child(period, "SegmentTemplate")) as_template = period_template;
            if (const xmlNode* node = first_child(adaptation, "SegmentTemplate")) {
                auto tpl = read_template(node, period_template);
                if (!tpl) return std::unexpected(tpl.error());
                as_template = std::move(*tpl);
            }

            std::optional<SegmentListInfo> as_list;
            if (const xmlNode* node = first_child(adaptation, "SegmentList")) {
                auto list = read_list(node, {});
                if (!list) return std::unexpected(list.error());
                as_list = std::move(*list);
            }

            for (const xmlNode* rep : children(adaptation, "Representation")) {
                const std::string rep_base = child_base(as_base, rep);
                const std::string rep_id = attribute(rep, "id").value_or("");
                std::uint64_t bandwidth = 0;
                if (auto ec = read_integer(rep, "bandwidth", bandwidth)) return std::unexpected(ec);

                std::optional<RepresentationSegments> found;
                if (const xmlNode* node = first_child(rep, "SegmentTemplate")) {
                    auto tpl = read_template(node, as_template.value_or(period_template));
                    if (!tpl) return std::unexpected(tpl.error());
                    auto generated = template_segments(*tpl, rep_id, bandwidth, rep_base, ctx);
                    if (!generated) return std::unexpected(generated.error());
                    found = std::move(*generated);
                } else if (const xmlNode* node = first_child(rep, "SegmentList")) {
                    auto list = read_list(node, as_list.value_or(SegmentListInfo{}));
                    if (!list) return std::unexpected(list.error());
                    found = list_segments(*list, rep_base);
                } else if (as_template) {
                    auto generated = template_segments(*as_template, rep_id, bandwidth, rep_base, ctx);
                    if (!generated) return std::unexpected(generated.error());
                    found = std::move(*generated);
                } else if (as_list) {
                    found = list_segments(*as_list, rep_base);
                }

                if (!found) continue;
                if (!period_head && found->media_end) {
                    period_head = found->media_end;
                    covered += *found->media_end - found->media_start;
                }
                segments.insert(segments.end(),
                                std::make_move_iterator(found->uris.begin()),
                                std::make_move_iterator(found->uris.end()));
            }
        }
        if (period_head) {
            head = ctx.period_start + *period_head;
        }
    }

    Seconds total = mpd_duration->value_or(covered);

    if (ctx.type == PresentationType::static_) {
        return Manifest::make_static(total, std::move(segments));
    }

    if (head && !(head->count() <= MAX_MEDIA_SECONDS)) {
        return std::unexpected(make_error_code(ParseErrc::invalid_segment_template));
    }

    DynamicTiming timing;
    timing.availability_start_time = *ctx.availability_start;
    timing.time_at_head = *ctx.availability_start +
        std::chrono::duration_cast<WallClock::duration>(head.value_or(Seconds{0}));
    if (*min_update) {
        timing.minimum_update_period = std::chrono::duration_cast<std::chrono::milliseconds>(**min_update);
    }
    return Manifest::make_dynamic(total, std::move(segments), timing);
}

} // namespace

//=============================================================================
// DASHParser
//=============================================================================

std::expected<Manifest, std::error_code>
DASHParser::parse(std::string_view content, WallClock::time_point now) noexcept {
    try {
        return parse_document(content, now);
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(ParseErrc::malformed_xml));
    }
}

std::expected<Seconds, std::error_code>
DASHParser::parse_duration(std::string_view value) noexcept {
    const auto invalid = std::unexpected(make_error_code(ParseErrc::invalid_duration));
    if (value.size() < 3 || value.front() != 'P') {
        return invalid;
    }

    double total = 0.0;
    bool in_time = false;
    bool any_component = false;
    std::size_t pos = 1;

    while (pos < value.size()) {
        if (value[pos] == 'T') {
            if (in_time) return invalid;
            in_time = true;
            ++pos;
            continue;
        }

        double number = 0.0;
        auto [ptr, ec] = std::from_chars(value.data() + pos, value.data() + value.size(), number,
                                         std::chars_format::fixed);
        if (ec != std::errc() || !std::isfinite(number) || number < 0.0) {
            return invalid;
        }
        pos = static_cast<std::size_t>(ptr - value.data());
        if (pos >= value.size()) return invalid;

        const char unit = value[pos++];
        double scale = 0.0;
        if (!in_time) {
            switch (unit) {
                case 'Y': scale = 365.0 * 86400.0; break;
                case 'M': scale = 30.0 * 86400.0; break;
                case 'W': scale = 7.0 * 86400.0; break;
                case 'D': scale = 86400.0; break;
                default: return invalid;
            }
        } else {
            switch (unit) {
                case 'H': scale = 3600.0; break;
                case 'M': scale = 60.0; break;
                case 'S': scale = 1.0; break;
                default: return invalid;
            }
        }
        total += number * scale;
        any_component = true;
    }

    if (!any_component || !(total <= MAX_MEDIA_SECONDS)) return invalid;
    return Seconds(total);
}

std::expected<WallClock::time_point, std::error_code>
DASHParser::parse_datetime(std::string_view value) noexcept {
    const auto invalid = std::unexpected(make_error_code(ParseErrc::invalid_datetime));
    // YYYY-MM-DDTHH:MM:SS
    if (value.size() < 19 || value[4] != '-' || value[7] != '-' ||
        (value[10] != 'T' && value[10] != 't' && value[10] != ' ') ||
        value[13] != ':' || value[16] != ':') {
        return invalid;
    }

    auto year = to_integer<int>(value.substr(0, 4));
    auto month = to_integer<unsigned>(value.substr(5, 2));
    auto day = to_integer<unsigned>(value.substr(8, 2));
    auto hour = to_integer<int>(value.substr(11, 2));
    auto minute = to_integer<int>(value.substr(14, 2));
    auto second = to_integer<int>(value.substr(17, 2));
    // Nanosecond time points span 1677 to 2262
    if (!year || !month || !day || !hour || !minute || !second || *year < 1700 || *year > 2200) {
        return invalid;
    }

    const std::chrono::year_month_day ymd{
        std::chrono::year{*year}, std::chrono::month{*month}, std::chrono::day{*day}};
    if (!ymd.ok() || *hour > 23 || *minute > 59 || *second > 60) {
        return invalid;
    }

    std::size_t pos = 19;
    std::chrono::nanoseconds fraction{0};
    if (pos < value.size() && value[pos] == '.') {
        ++pos;
        std::int64_t scale = 100'000'000;
        const std::size_t digits_start = pos;
        while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos]))) {
            fraction += std::chrono::nanoseconds((value[pos] - '0') * scale);
            scale /= 10;
            ++pos;
        }
        if (pos == digits_start) return invalid;
    }

    std::chrono::minutes offset{0};
    if (pos < value.size()) {
        const char zone = value[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            auto rest = value.substr(pos + 1);
            std::optional<int> off_h;
            std::optional<int> off_m;
            if (rest.size() == 5 && rest[2] == ':') {
                off_h = to_integer<int>(rest.substr(0, 2));
                off_m = to_integer<int>(rest.substr(3, 2));
            } else if (rest.size() == 4) {
                off_h = to_integer<int>(rest.substr(0, 2));
                off_m = to_integer<int>(rest.substr(2, 2));
            } else if (rest.size() == 2) {
                off_h = to_integer<int>(rest);
                off_m = 0;
            }
            if (!off_h || !off_m || *off_h > 23 || *off_m > 59) return invalid;
            offset = std::chrono::hours(*off_h) + std::chrono::minutes(*off_m);
            if (zone == '-') offset = -offset;
            pos = value.size();
        } else {
            return invalid;
        }
    }
    if (pos != value.size()) return invalid;

    const auto local = std::chrono::sys_days{ymd}
        + std::chrono::hours(*hour) + std::chrono::minutes(*minute) + std::chrono::seconds(*second)
        + fraction;
    return std::chrono::time_point_cast<WallClock::duration>(local - offset);
}

std::string DASHParser::expand_template(std::string_view tmpl,
                                        std::string_view representation_id,
                                        std::uint64_t bandwidth,
                                        std::uint64_t number,
                                        std::uint64_t time) {
    std::string out;
    out.reserve(tmpl.size() + 16);

    std::size_t i = 0;
    while (i < tmpl.size()) {
        if (tmpl[i] != '$') {
            out += tmpl[i++];
            continue;
        }
        auto close = tmpl.find('$', i + 1);
        if (close == std::string_view::npos) {
            out.append(tmpl.substr(i));
            break;
        }

        auto ident = tmpl.substr(i + 1, close - i - 1);
        i = close + 1;
        if (ident.empty()) {
            out += '$';
            continue;
        }

        std::string_view format;
        if (auto pct = ident.find('%'); pct != std::string_view::npos) {
            format = ident.substr(pct);
            ident = ident.substr(0, pct);
        }

        if (ident == "RepresentationID") {
            out += representation_id;
        } else if (ident == "Number") {
            out += format_number(number, format);
        } else if (ident == "Time") {
            out += format_number(time, format);
        } else if (ident == "Bandwidth") {
            out += format_number(bandwidth, format);
        } else {
            // Unknown identifier, keep verbatim
            out += '$';
            out += ident;
            out += format;
            out += '$';
        }
    }
    return out;
}

} // namespace dashcheck::media
