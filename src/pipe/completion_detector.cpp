#include "completion_detector.hpp"
#include "chrome.hpp"
#include "sentinel.hpp"
#include <core/log.hpp>

const char* completion_kind_name(CompletionKind kind) {
    switch (kind) {
        case CompletionKind::CompletedViaMarker: return "marker";
        case CompletionKind::CompletedViaIdle:   return "idle";
        case CompletionKind::TimedOut:           return "timeout";
    }
    return "unknown";
}

CompletionDetector::CompletionDetector(DetectorOptions options, platform::Clock& clock)
    : options_(options), clock_(clock) {}

CompletionOutcome CompletionDetector::wait(const Capture& capture,
                                           const std::string& baseline,
                                           const std::string& marker) const {
    using duration = platform::Clock::duration;

    const int baseline_markers = count_marker_lines(baseline, marker);
    const duration fallback_idle = duration(static_cast<long long>(
        options_.idle_timeout.count() * options_.idle_fallback_factor));

    const duration start = clock_.now();
    if (options_.initial_delay.count() > 0) clock_.sleep(options_.initial_delay);

    std::string last_norm = chrome::normalize_snapshot(baseline);
    bool armed = false;
    duration last_change = start;
    int polls = 0;

    while (true) {
        std::string content = capture();
        polls++;
        const duration now = clock_.now();

        if (count_marker_lines(content, marker) > baseline_markers) {
            pipe_logf("detector: marker seen after {} ms ({} polls)",
                      (now - start).count(), polls);
            if (options_.marker_settle.count() > 0) {
                clock_.sleep(options_.marker_settle);
                content = capture();
            }
            return {CompletionKind::CompletedViaMarker, content, now - start, polls};
        }

        std::string norm = chrome::normalize_snapshot(content);
        if (norm != last_norm) {
            last_norm = std::move(norm);
            last_change = now;
            armed = true;
        }

        const duration idle = now - last_change;
        if (armed && idle >= options_.idle_timeout) {
            bool ready = !ready_check_ || ready_check_(content) || idle >= fallback_idle;
            if (ready) {
                pipe_logf("detector: idle for {} ms after {} ms ({} polls)",
                          idle.count(), (now - start).count(), polls);
                return {CompletionKind::CompletedViaIdle, content, now - start, polls};
            }
        }

        if (now - start >= options_.max_wait) {
            pipe_logf("detector: gave up after {} ms ({} polls)", (now - start).count(), polls);
            return {CompletionKind::TimedOut, content, now - start, polls};
        }

        clock_.sleep(options_.poll_interval);
    }
}
