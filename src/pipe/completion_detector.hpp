#pragma once

#include <functional>
#include <string>
#include <platform/clock.hpp>

enum class CompletionKind {
    CompletedViaMarker,
    CompletedViaIdle,
    TimedOut,
};

const char* completion_kind_name(CompletionKind kind);

struct CompletionOutcome {
    CompletionKind kind;
    std::string snapshot;                 // final (or, on timeout, latest) pane text
    platform::Clock::duration elapsed;    // since the detector started waiting
    int polls = 0;                        // number of captures taken in the loop
};

struct DetectorOptions {
    platform::Clock::duration poll_interval{500};
    platform::Clock::duration idle_timeout{5000};
    platform::Clock::duration max_wait{300000};
    platform::Clock::duration initial_delay{0};    // before the first poll
    platform::Clock::duration marker_settle{0};    // recapture after the marker shows
    double idle_fallback_factor = 3.0;             // used only with a readiness check
};

// Waits for the agent to finish answering.
//
// Each tick captures the pane and decides, in this order:
//   1. marker   more marker lines than the baseline had  -> CompletedViaMarker
//   2. idle     normalized text unchanged for idle_timeout -> CompletedViaIdle
//   3. ceiling  elapsed >= max_wait                       -> TimedOut
// then sleeps poll_interval. Idle detection arms only once the normalized
// text has differed from the baseline, so a pane where nothing happens runs
// into the ceiling. With a readiness check, idle completion also requires
// the check to pass, unless idle has lasted idle_timeout * idle_fallback_factor.
class CompletionDetector {
public:
    using Capture = std::function<std::string()>;
    using ReadyCheck = std::function<bool(const std::string& snapshot)>;

    CompletionDetector(DetectorOptions options, platform::Clock& clock);

    void set_ready_check(ReadyCheck check) { ready_check_ = std::move(check); }

    CompletionOutcome wait(const Capture& capture,
                           const std::string& baseline,
                           const std::string& marker) const;

private:
    DetectorOptions options_;
    platform::Clock& clock_;
    ReadyCheck ready_check_;
};
