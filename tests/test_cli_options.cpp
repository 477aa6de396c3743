#include <gtest/gtest.h>
#include <cli/options.hpp>

using Args = std::vector<std::string>;

TEST(CliOptions, WordsFormTheMessage) {
    auto r = parse_cli({"what", "is", "2+2?"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(message_from_args(r.value), "what is 2+2?");
    EXPECT_FALSE(r.value.verbose);
}

TEST(CliOptions, FlagsAndValues) {
    auto r = parse_cli({"-v", "-s", "work", "--agent=claude --fast", "--idle", "2.5",
                        "--timeout=60", "-c", "/tmp/cfg.yaml", "hello"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& o = r.value;
    EXPECT_TRUE(o.verbose);
    EXPECT_EQ(o.session.value_or(""), "work");
    EXPECT_EQ(o.agent_cmd.value_or(""), "claude --fast");
    EXPECT_DOUBLE_EQ(o.idle_timeout.value_or(0), 2.5);
    EXPECT_DOUBLE_EQ(o.max_wait.value_or(0), 60);
    EXPECT_EQ(o.config_path.value_or(""), "/tmp/cfg.yaml");
    EXPECT_EQ(o.message_words, (Args{"hello"}));
}

TEST(CliOptions, DoubleDashEndsOptions) {
    auto r = parse_cli({"--", "-v", "--help"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_FALSE(r.value.verbose);
    EXPECT_FALSE(r.value.help);
    EXPECT_EQ(message_from_args(r.value), "-v --help");
}

TEST(CliOptions, Errors) {
    EXPECT_TRUE(parse_cli({"--bogus"}).is_err());
    EXPECT_TRUE(parse_cli({"-s"}).is_err());
    EXPECT_TRUE(parse_cli({"--idle", "soon"}).is_err());
    EXPECT_TRUE(parse_cli({"--timeout=0"}).is_err());

    auto r = parse_cli({"hi", "--nope"});
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("--nope"), std::string::npos);
}

TEST(CliOptions, HelpAndVersion) {
    EXPECT_TRUE(parse_cli({"-h"}).value.help);
    EXPECT_TRUE(parse_cli({"--version"}).value.version);
}

TEST(CliOptions, ApplyOverridesSettings) {
    auto r = parse_cli({"-s", "other", "--idle", "1", "--timeout", "20"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    PipeSettings s;
    apply_cli(r.value, s);
    EXPECT_EQ(s.session, "other");
    EXPECT_EQ(s.agent.command, "claude");
    EXPECT_DOUBLE_EQ(s.timing.idle_timeout, 1);
    EXPECT_DOUBLE_EQ(s.timing.max_wait, 20);
}

TEST(CliOptions, UsageMentionsFlags) {
    std::string usage = usage_text("panepipe");
    EXPECT_NE(usage.find("--session"), std::string::npos);
    EXPECT_NE(usage.find("--timeout"), std::string::npos);
}
