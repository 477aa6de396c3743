#include <gtest/gtest.h>
#include <pipe/bootstrapper.hpp>
#include <core/errors.hpp>
#include "fakes.hpp"

using ms = std::chrono::milliseconds;

static const std::string PROMPT_BOX =
    "\xe2\x95\xad\xe2\x94\x80\xe2\x94\x80\xe2\x95\xae\n"
    "\xe2\x94\x82 \xe2\x9d\xaf \xe2\x94\x82\n"
    "\xe2\x95\xb0\xe2\x94\x80\xe2\x94\x80\xe2\x95\xaf\n";

// Pressing Enter after typing the agent command brings the agent up.
static void start_agent_on_enter(FakeMultiplexer& mux, const std::string& key) {
    if (key == "Enter" && mux.last_text == "claude") mux.foreground = "node";
}

TEST(SessionBootstrapper, NoOpWhenAgentRunning) {
    FakeMultiplexer mux;
    FakeClock clock;
    mux.foreground = "node";

    SessionBootstrapper boot(mux, clock);
    EXPECT_FALSE(boot.ensure_agent_running(Session{"s"}, "claude"));
    EXPECT_TRUE(mux.events.empty());
    EXPECT_TRUE(clock.sleeps.empty());
}

TEST(SessionBootstrapper, MatchesProcessNameCaseInsensitively) {
    FakeMultiplexer mux;
    FakeClock clock;
    mux.foreground = "claude-code";
    BootstrapOptions opts;
    opts.process_names = {"Claude"};

    SessionBootstrapper boot(mux, clock, opts);
    EXPECT_TRUE(boot.agent_running(Session{"s"}));
}

TEST(SessionBootstrapper, LaunchesAndWaitsForPrompt) {
    FakeMultiplexer mux;
    FakeClock clock;
    mux.on_key = start_agent_on_enter;
    mux.screen = "Welcome to the agent\n\n" + PROMPT_BOX + "  ? for shortcuts\n";

    SessionBootstrapper boot(mux, clock);
    EXPECT_TRUE(boot.ensure_agent_running(Session{"s"}, "claude"));

    std::vector<std::string> expected = {"keys:claude", "key:Enter", "capture"};
    EXPECT_EQ(mux.events, expected);
    EXPECT_EQ(clock.sleeps, (std::vector<ms>{ms(600), ms(5000), ms(500)}));
}

TEST(SessionBootstrapper, AcceptsOutputThatStaysSettled) {
    FakeMultiplexer mux;
    FakeClock clock;
    mux.on_key = start_agent_on_enter;
    mux.screen = "agent v2 ready\ntype a message\n";

    SessionBootstrapper boot(mux, clock);
    EXPECT_TRUE(boot.ensure_agent_running(Session{"s"}, "claude"));
    // first sight at +500, unchanged for the 1000 ms settle window
    EXPECT_EQ(mux.count("capture"), 3);
    EXPECT_EQ(clock.now(), ms(600 + 5000 + 1500));
}

TEST(SessionBootstrapper, BriefLoadingScreenIsNotStarted) {
    FakeMultiplexer mux;
    FakeClock clock;
    mux.on_key = start_agent_on_enter;
    int captures = 0;
    mux.screen_fn = [&captures](const FakeMultiplexer&) {
        return ++captures <= 2 ? std::string("Loading agent\n") : PROMPT_BOX;
    };

    SessionBootstrapper boot(mux, clock);
    EXPECT_TRUE(boot.ensure_agent_running(Session{"s"}, "claude"));
    EXPECT_EQ(captures, 3);
}

TEST(SessionBootstrapper, WaitsBeforeLookingForPrompt) {
    FakeMultiplexer mux;
    FakeClock clock;
    mux.on_key = start_agent_on_enter;
    mux.screen = PROMPT_BOX;

    SessionBootstrapper boot(mux, clock);
    boot.ensure_agent_running(Session{"s"}, "claude");
    EXPECT_EQ(mux.count("capture"), 1);
    EXPECT_GE(clock.now(), ms(600 + 5000));
}

// Clock that brings the agent process up after a number of sleeps.
class StartAfterSleeps : public platform::Clock {
public:
    StartAfterSleeps(FakeClock& inner, FakeMultiplexer& mux, int sleeps)
        : inner_(inner), mux_(mux), remaining_(sleeps) {}

    duration now() override { return inner_.now(); }
    void sleep(duration d) override {
        inner_.sleep(d);
        if (--remaining_ == 0) mux_.foreground = "node";
    }

private:
    FakeClock& inner_;
    FakeMultiplexer& mux_;
    int remaining_;
};

TEST(SessionBootstrapper, WaitsForProcessBeforeCapturing) {
    FakeMultiplexer mux;
    FakeClock clock;
    mux.screen = PROMPT_BOX;
    StartAfterSleeps slow_start(clock, mux, 4);

    BootstrapOptions opts;
    opts.poll_interval = ms(100);
    SessionBootstrapper boot(mux, slow_start, opts);

    EXPECT_TRUE(boot.ensure_agent_running(Session{"s"}, "claude"));
    EXPECT_EQ(mux.count("capture"), 1);
    EXPECT_EQ(clock.now(), ms(600 + 5000 + 200));
}

TEST(SessionBootstrapper, TimesOutWhenAgentNeverStarts) {
    FakeMultiplexer mux;
    FakeClock clock;
    BootstrapOptions opts;
    opts.startup_timeout = ms(8000);

    SessionBootstrapper boot(mux, clock, opts);
    try {
        boot.ensure_agent_running(Session{"s"}, "claude");
        FAIL() << "expected PipeError";
    } catch (const PipeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::AgentStartTimeout);
    }
    EXPECT_EQ(mux.count("capture"), 0);
    EXPECT_GE(clock.now(), ms(600 + 8000));
}

TEST(SessionBootstrapper, TimesOutWhileOutputKeepsChanging) {
    FakeMultiplexer mux;
    FakeClock clock;
    mux.on_key = start_agent_on_enter;
    int frame = 0;
    mux.screen_fn = [&frame](const FakeMultiplexer&) {
        return "loading " + std::to_string(frame++);
    };
    BootstrapOptions opts;
    opts.startup_timeout = ms(2000);
    opts.startup_wait = ms(0);

    SessionBootstrapper boot(mux, clock, opts);
    EXPECT_THROW(boot.ensure_agent_running(Session{"s"}, "claude"), PipeError);
    EXPECT_EQ(mux.count("capture"), 4);
}
