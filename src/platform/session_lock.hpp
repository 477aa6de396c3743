#pragma once
#include <string>
#include <filesystem>
#include <platform/clock.hpp>

// RAII advisory lock serializing panepipe invocations against one session.
// Uses flock(); the lock is released when the process exits (even on crash).
class SessionLock {
public:
    // Lock file for a session: <dir>/panepipe-<session>.lock, dir defaulting to $TMPDIR
    static std::filesystem::path path_for(const std::string& session,
                                          const std::filesystem::path& dir = {});

    // Retries a non-blocking flock() until timeout. Check held() after construction.
    SessionLock(const std::filesystem::path& lock_path,
                platform::Clock::duration timeout,
                platform::Clock& clock);
    ~SessionLock();

    SessionLock(const SessionLock&) = delete;
    SessionLock& operator=(const SessionLock&) = delete;

    // Returns true if this instance holds the lock.
    bool held() const { return fd_ >= 0; }

    // The lock file could not be opened at all (as opposed to being busy).
    bool open_failed() const { return open_errno_ != 0; }
    std::string open_error() const;

private:
    int fd_ = -1;
    int open_errno_ = 0;
};
