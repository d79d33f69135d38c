// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dashcheck/core/segment_verifier.hpp>
#include <dashcheck/core/log.hpp>
#include <dashcheck/core/url.hpp>
#include <algorithm>
#include <exception>
#include <thread>

namespace dashcheck::core {

SegmentVerifier::SegmentVerifier(Transport& transport,
                                 std::string base_url,
                                 std::chrono::milliseconds probe_delay,
                                 Sleeper sleeper)
    : transport_(transport)
    , base_url_(std::move(base_url))
    , probe_delay_(std::max(probe_delay, MIN_PROBE_DELAY))
    , sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

SegmentOutcome SegmentVerifier::probe(const SegmentPredicate& predicate,
                                      const std::string& uri,
                                      bool full_download) {
    const std::string url = resolve_url(base_url_, uri);
    auto headers = full_download
        ? transport_.fetch_segment_full(url)
        : transport_.fetch_segment_headers(url);

    if (!headers) {
        logger()->debug("segment {} transport failure: {}", url, headers.error().message());
        SegmentFailed failed;
        failed.uri = uri;
        failed.kind = FailureKind::transport;
        failed.reason = headers.error().message();
        failed.error = headers.error();
        return failed;
    }

    bool accepted = false;
    try {
        accepted = predicate ? predicate(*headers) : default_segment_predicate(*headers);
    } catch (const std::exception& e) {
        logger()->warn("segment predicate threw for {}: {}", url, e.what());
        accepted = false;
    }

    if (accepted) {
        return SegmentOk{uri};
    }

    logger()->debug("segment {} rejected by header policy", url);
    SegmentFailed failed;
    failed.uri = uri;
    failed.kind = FailureKind::policy;
    failed.reason = std::string(POLICY_REASON);
    failed.headers = std::move(*headers);
    return failed;
}

VerificationReport SegmentVerifier::verify(const SegmentPredicate& predicate,
                                           const std::vector<std::string>& segments,
                                           bool full_download) {
    VerificationReport report;
    VerifyProgress progress;
    progress.total = segments.size();

    logger()->debug("verifying {} segments ({}, {} ms apart)",
                    segments.size(), full_download ? "GET" : "HEAD", probe_delay_.count());

    for (std::size_t i = 0; i < segments.size(); ++i) {
        // Rate limit between the end of one probe and the start of the next
        if (i > 0) {
            sleeper_(probe_delay_);
        }

        auto outcome = probe(predicate, segments[i], full_download);
        if (auto* ok = std::get_if<SegmentOk>(&outcome)) {
            report.ok.push_back(std::move(*ok));
            ++progress.ok;
        } else {
            report.failed.push_back(std::get<SegmentFailed>(std::move(outcome)));
            ++progress.failed;
        }

        ++progress.completed;
        if (callback_) {
            callback_(progress);
        }
    }

    logger()->debug("segment verification done: {} ok, {} failed",
                    report.ok.size(), report.failed.size());
    return report;
}

} // namespace dashcheck::core
