#pragma once

#include <functional>
#include <set>
#include <string>
#include <vector>
#include <core/errors.hpp>
#include <platform/clock.hpp>
#include <tmux/multiplexer.hpp>

// Clock that only moves when something sleeps.
class FakeClock : public platform::Clock {
public:
    duration now() override { return now_; }
    void sleep(duration d) override {
        sleeps.push_back(d);
        now_ += d;
    }
    void advance(duration d) { now_ += d; }

    std::vector<duration> sleeps;

private:
    duration now_{0};
};

// Scripted multiplexer. Every call is appended to `events`:
//   "ensure:<name>", "keys:<text>", "key:<key>", "paste:<text>", "capture"
class FakeMultiplexer : public TerminalMultiplexer {
public:
    std::vector<std::string> events;
    std::set<std::string> sessions;
    std::string foreground = "zsh";
    std::string screen;
    bool fail_sends = false;

    // Optional: compute the pane from the events so far.
    std::function<std::string(const FakeMultiplexer&)> screen_fn;
    // Optional: react to a pressed key (e.g. start the agent on Enter).
    std::function<void(FakeMultiplexer&, const std::string& key)> on_key;

    Session ensure_session(const std::string& name) override {
        events.push_back("ensure:" + name);
        sessions.insert(name);
        return Session{name};
    }

    void send_keys(const Session& session, const std::string& text, bool submit) override {
        check_send();
        events.push_back("keys:" + text);
        last_text = text;
        if (submit) send_key(session, "Enter");
    }

    void send_key(const Session&, const std::string& key) override {
        check_send();
        events.push_back("key:" + key);
        if (on_key) on_key(*this, key);
    }

    void paste_text(const Session&, const std::string& text) override {
        check_send();
        events.push_back("paste:" + text);
        last_text = text;
    }

    std::string capture_pane(const Session&, int) override {
        events.push_back("capture");
        return screen_fn ? screen_fn(*this) : screen;
    }

    std::string current_command(const Session&) override {
        return foreground;
    }

    // Text of the most recent keys/paste call.
    std::string last_text;

    int count(const std::string& prefix) const {
        int n = 0;
        for (const auto& e : events)
            if (e.compare(0, prefix.size(), prefix) == 0) n++;
        return n;
    }

private:
    void check_send() {
        if (fail_sends) {
            throw PipeError(ErrorKind::SessionError, "tmux send-keys failed (exit 1): no server");
        }
    }
};
