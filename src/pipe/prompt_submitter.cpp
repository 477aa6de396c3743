#include "prompt_submitter.hpp"
#include "sentinel.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

PromptSubmitter::PromptSubmitter(TerminalMultiplexer& mux, platform::Clock& clock,
                                 SubmitOptions options)
    : mux_(mux), clock_(clock), options_(std::move(options)) {}

void PromptSubmitter::send_and_enter(const Session& session, const std::string& text) {
    if (text.find('\n') == std::string::npos) {
        mux_.send_keys(session, text, false);
    } else {
        mux_.paste_text(session, text);
    }
    clock_.sleep(options_.submit_delay);
    mux_.send_key(session, "Enter");
}

std::string PromptSubmitter::submit(const Session& session, const std::string& prompt,
                                    const std::string& marker) {
    try {
        if (!options_.clear_command.empty()) {
            pipe_status(options_.clear_command);
            send_and_enter(session, options_.clear_command);
            clock_.sleep(options_.clear_settle);
        }

        std::string baseline = mux_.capture_pane(session, options_.scrollback);

        std::string text = build_marker_prompt(prompt, marker);
        pipe_status(fmt::format("sending prompt ({} bytes{})...", text.size(),
                                text.find('\n') == std::string::npos ? "" : ", pasted"));
        send_and_enter(session, text);
        return baseline;
    } catch (const PipeError& e) {
        if (e.kind() == ErrorKind::SessionUnavailable) throw;
        throw PipeError(ErrorKind::SubmitFailed,
                        fmt::format("could not deliver prompt: {}", e.what()), e.detail());
    }
}
