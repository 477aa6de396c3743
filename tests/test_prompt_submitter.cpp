#include <gtest/gtest.h>
#include <pipe/prompt_submitter.hpp>
#include <core/errors.hpp>
#include "fakes.hpp"

using ms = std::chrono::milliseconds;

static const std::string MARKER = "<<<DONE-7f3a>>>";

TEST(PromptSubmitter, ClearsThenTypesPrompt) {
    FakeMultiplexer mux;
    FakeClock clock;
    mux.screen = "fresh pane\n";

    PromptSubmitter submitter(mux, clock);
    std::string baseline = submitter.submit(Session{"s"}, "What is 2+2?", MARKER);

    EXPECT_EQ(baseline, "fresh pane\n");
    std::vector<std::string> expected = {
        "keys:/clear",
        "key:Enter",
        "capture",
        "keys:What is 2+2? (When done, print " + MARKER + " on its own line)",
        "key:Enter",
    };
    EXPECT_EQ(mux.events, expected);
    EXPECT_EQ(clock.sleeps, (std::vector<ms>{ms(600), ms(1000), ms(600)}));
}

TEST(PromptSubmitter, BaselineIsTakenAfterReset) {
    FakeMultiplexer mux;
    FakeClock clock;
    mux.screen = "old conversation\n";
    mux.on_key = [](FakeMultiplexer& m, const std::string& key) {
        if (key == "Enter" && m.last_text == "/clear") m.screen = "cleared\n";
    };

    PromptSubmitter submitter(mux, clock);
    EXPECT_EQ(submitter.submit(Session{"s"}, "hi", MARKER), "cleared\n");
}

TEST(PromptSubmitter, MultiLinePromptIsPasted) {
    FakeMultiplexer mux;
    FakeClock clock;

    PromptSubmitter submitter(mux, clock);
    submitter.submit(Session{"s"}, "line one\nline two\n", MARKER);

    EXPECT_EQ(mux.count("paste:"), 1);
    EXPECT_EQ(mux.count("keys:"), 1);    // only the /clear
    EXPECT_EQ(mux.last_text,
              "line one\nline two\n\n(When done, print " + MARKER + " on its own line)");
    EXPECT_EQ(mux.events.back(), "key:Enter");
}

TEST(PromptSubmitter, EmptyClearCommandSkipsReset) {
    FakeMultiplexer mux;
    FakeClock clock;
    SubmitOptions opts;
    opts.clear_command = "";

    PromptSubmitter submitter(mux, clock, opts);
    submitter.submit(Session{"s"}, "hi", MARKER);

    ASSERT_EQ(mux.events.size(), 3u);
    EXPECT_EQ(mux.events[0], "capture");
    EXPECT_EQ(clock.sleeps, (std::vector<ms>{ms(600)}));
}

TEST(PromptSubmitter, DeliveryFailureIsSubmitFailed) {
    FakeMultiplexer mux;
    FakeClock clock;
    mux.fail_sends = true;

    PromptSubmitter submitter(mux, clock);
    try {
        submitter.submit(Session{"s"}, "hi", MARKER);
        FAIL() << "expected PipeError";
    } catch (const PipeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SubmitFailed);
        EXPECT_NE(std::string(e.what()).find("no server"), std::string::npos);
    }
}
