#include <gtest/gtest.h>
#include <tmux/tmux_multiplexer.hpp>
#include <core/errors.hpp>
#include <deque>

using Args = std::vector<std::string>;

// Runner that records each call and answers from a queue (default: success).
struct RecordingRunner {
    struct Call {
        std::string program;
        Args args;
        std::string stdin_data;
    };
    std::vector<Call> calls;
    std::deque<CommandResult> replies;

    TmuxMultiplexer::Runner runner() {
        return [this](const std::string& program, const Args& args, const std::string& in) {
            calls.push_back({program, args, in});
            if (replies.empty()) return CommandResult{0, "", ""};
            CommandResult r = replies.front();
            replies.pop_front();
            return r;
        };
    }
};

TEST(TmuxMultiplexer, Targets) {
    EXPECT_EQ(TmuxMultiplexer::session_target("work"), "=work");
    EXPECT_EQ(TmuxMultiplexer::pane_target("work"), "=work:");
}

TEST(TmuxMultiplexer, ReusesExistingSession) {
    RecordingRunner rec;
    TmuxMultiplexer tmux(rec.runner(), "/usr/bin/tmux");
    Session s = tmux.ensure_session("work");
    EXPECT_EQ(s.name, "work");
    ASSERT_EQ(rec.calls.size(), 1u);
    EXPECT_EQ(rec.calls[0].program, "/usr/bin/tmux");
    EXPECT_EQ(rec.calls[0].args, (Args{"has-session", "-t", "=work"}));
}

TEST(TmuxMultiplexer, CreatesMissingSession) {
    RecordingRunner rec;
    rec.replies = {{1, "", "can't find session: work"}, {0, "", ""}};
    TmuxMultiplexer tmux(rec.runner(), "tmux", 120, 40);
    tmux.ensure_session("work");
    ASSERT_EQ(rec.calls.size(), 2u);
    EXPECT_EQ(rec.calls[1].args, (Args{"new-session", "-d", "-s", "work", "-x", "120", "-y", "40"}));
}

TEST(TmuxMultiplexer, CreationRaceIsTolerated) {
    RecordingRunner rec;
    rec.replies = {{1, "", ""}, {1, "", "duplicate session: work"}, {0, "", ""}};
    TmuxMultiplexer tmux(rec.runner(), "tmux");
    EXPECT_NO_THROW(tmux.ensure_session("work"));
    EXPECT_EQ(rec.calls.size(), 3u);
}

TEST(TmuxMultiplexer, CreationFailureIsUnavailable) {
    RecordingRunner rec;
    rec.replies = {{1, "", ""}, {1, "", "no server running"}, {1, "", ""}};
    TmuxMultiplexer tmux(rec.runner(), "tmux");
    try {
        tmux.ensure_session("work");
        FAIL() << "expected PipeError";
    } catch (const PipeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SessionUnavailable);
        EXPECT_NE(std::string(e.what()).find("no server running"), std::string::npos);
    }
}

TEST(TmuxMultiplexer, SendKeysIsLiteralThenEnter) {
    RecordingRunner rec;
    TmuxMultiplexer tmux(rec.runner(), "tmux");
    tmux.send_keys(Session{"work"}, "-n; echo hi", true);
    ASSERT_EQ(rec.calls.size(), 2u);
    EXPECT_EQ(rec.calls[0].args, (Args{"send-keys", "-t", "=work:", "-l", "--", "-n; echo hi"}));
    EXPECT_EQ(rec.calls[1].args, (Args{"send-keys", "-t", "=work:", "Enter"}));
}

TEST(TmuxMultiplexer, SendKeysWithoutSubmit) {
    RecordingRunner rec;
    TmuxMultiplexer tmux(rec.runner(), "tmux");
    tmux.send_keys(Session{"work"}, "text", false);
    EXPECT_EQ(rec.calls.size(), 1u);
    tmux.send_keys(Session{"work"}, "", false);
    EXPECT_EQ(rec.calls.size(), 1u);
}

TEST(TmuxMultiplexer, PasteUsesNamedBuffer) {
    RecordingRunner rec;
    TmuxMultiplexer tmux(rec.runner(), "tmux");
    tmux.paste_text(Session{"work"}, "line one\nline two");
    ASSERT_EQ(rec.calls.size(), 2u);
    EXPECT_EQ(rec.calls[0].args, (Args{"load-buffer", "-b", "panepipe-work", "-"}));
    EXPECT_EQ(rec.calls[0].stdin_data, "line one\nline two");
    EXPECT_EQ(rec.calls[1].args,
              (Args{"paste-buffer", "-p", "-d", "-b", "panepipe-work", "-t", "=work:"}));
}

TEST(TmuxMultiplexer, SessionsPasteThroughSeparateBuffers) {
    RecordingRunner rec;
    TmuxMultiplexer tmux(rec.runner(), "tmux");
    tmux.paste_text(Session{"work"}, "a\nb");
    tmux.paste_text(Session{"play"}, "c\nd");
    ASSERT_EQ(rec.calls.size(), 4u);
    EXPECT_EQ(rec.calls[0].args[2], "panepipe-work");
    EXPECT_EQ(rec.calls[2].args[2], "panepipe-play");
    EXPECT_EQ(rec.calls[3].args[4], "panepipe-play");
    EXPECT_EQ(rec.calls[3].args.back(), "=play:");
}

TEST(TmuxMultiplexer, CapturePane) {
    RecordingRunner rec;
    rec.replies = {{0, "screen text\n", ""}, {0, "with history\n", ""}};
    TmuxMultiplexer tmux(rec.runner(), "tmux");
    EXPECT_EQ(tmux.capture_pane(Session{"work"}), "screen text\n");
    EXPECT_EQ(rec.calls[0].args, (Args{"capture-pane", "-p", "-J", "-t", "=work:"}));
    EXPECT_EQ(tmux.capture_pane(Session{"work"}, 500), "with history\n");
    EXPECT_EQ(rec.calls[1].args, (Args{"capture-pane", "-p", "-J", "-t", "=work:", "-S", "-500"}));
}

TEST(TmuxMultiplexer, CurrentCommandIsNormalized) {
    RecordingRunner rec;
    rec.replies = {{0, "Node\n", ""}};
    TmuxMultiplexer tmux(rec.runner(), "tmux");
    EXPECT_EQ(tmux.current_command(Session{"work"}), "node");
    EXPECT_EQ(rec.calls[0].args,
              (Args{"display-message", "-p", "-t", "=work:", "#{pane_current_command}"}));
}

TEST(TmuxMultiplexer, HasRunningCommand) {
    RecordingRunner rec;
    rec.replies = {{0, "node\n", ""}, {0, "zsh\n", ""}};
    TmuxMultiplexer tmux(rec.runner(), "tmux");
    EXPECT_TRUE(tmux.has_running_command(Session{"work"}, {"node", "claude"}));
    EXPECT_FALSE(tmux.has_running_command(Session{"work"}, {"node", "claude"}));
}

TEST(TmuxMultiplexer, FailedCommandIsSessionError) {
    RecordingRunner rec;
    rec.replies = {{1, "", "can't find pane: =work:"}};
    TmuxMultiplexer tmux(rec.runner(), "tmux");
    try {
        tmux.capture_pane(Session{"work"});
        FAIL() << "expected PipeError";
    } catch (const PipeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SessionError);
        EXPECT_NE(std::string(e.what()).find("can't find pane"), std::string::npos);
    }
}

TEST(TmuxMultiplexer, ExecFailureIsUnavailable) {
    RecordingRunner rec;
    rec.replies = {{127, "", "exec failed"}};
    TmuxMultiplexer tmux(rec.runner(), "tmux");
    try {
        tmux.send_key(Session{"work"}, "Enter");
        FAIL() << "expected PipeError";
    } catch (const PipeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SessionUnavailable);
    }
}
