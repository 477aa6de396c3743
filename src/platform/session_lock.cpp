#include "session_lock.hpp"
#include "platform.hpp"
#include <core/constants.hpp>

#include <sys/file.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

std::filesystem::path SessionLock::path_for(const std::string& session,
                                            const std::filesystem::path& dir) {
    std::string safe;
    for (char c : session) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '-' || c == '_';
        safe += ok ? c : '_';
    }
    std::string file = std::string(PANEPIPE_NAME) + "-" + safe + ".lock";
    return (dir.empty() ? platform::temp_dir() : dir) / file;
}

SessionLock::SessionLock(const std::filesystem::path& lock_path,
                         platform::Clock::duration timeout,
                         platform::Clock& clock) {
    std::error_code ec;
    std::filesystem::create_directories(lock_path.parent_path(), ec);

    int fd = open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd < 0) {
        open_errno_ = errno ? errno : EIO;
        return;
    }

    auto deadline = clock.now() + timeout;
    while (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        if (clock.now() >= deadline) {
            close(fd);
            return;
        }
        clock.sleep(platform::Clock::duration(LOCK_RETRY_MS));
    }
    fd_ = fd;
}

std::string SessionLock::open_error() const {
    return open_errno_ ? std::strerror(open_errno_) : "";
}

SessionLock::~SessionLock() {
    if (fd_ < 0) return;
    close(fd_);
    // flock is released automatically when fd is closed
}
