#include "auth/PasswordPrompt.hpp"
#include "types/Error.hpp"
#include "util/FileLock.hpp"

#include <fcntl.h>
#include <termios.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

using namespace dredge;
using namespace dredge::auth;

namespace {

// Restores the terminal's echo flag on every exit path
class EchoGuard {
public:
    explicit EchoGuard(const int fd) : fd_(fd) {
        if (tcgetattr(fd_, &saved_) != 0) return;
        termios quiet = saved_;
        quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        active_ = tcsetattr(fd_, TCSAFLUSH, &quiet) == 0;
    }

    ~EchoGuard() { if (active_) tcsetattr(fd_, TCSAFLUSH, &saved_); }

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;

private:
    int fd_;
    termios saved_{};
    bool active_ = false;
};

void writeAll(const int fd, const std::string& s) {
    size_t off = 0;
    while (off < s.size()) {
        const ssize_t w = ::write(fd, s.data() + off, s.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            throw Error(ErrorCode::IOFailure, std::string("Failed to write prompt: ") + std::strerror(errno));
        }
        off += static_cast<size_t>(w);
    }
}

}

std::string TerminalPrompt::read(const std::string& message) {
    const util::unique_fd tty(::open("/dev/tty", O_RDWR | O_CLOEXEC));
    if (!tty) throw Error(ErrorCode::IOFailure, std::string("No controlling terminal: ") + std::strerror(errno));

    writeAll(tty.get(), message);

    std::string password;
    {
        EchoGuard guard(tty.get());
        char c;
        while (true) {
            const ssize_t r = ::read(tty.get(), &c, 1);
            if (r < 0) {
                if (errno == EINTR) continue;
                throw Error(ErrorCode::IOFailure, std::string("Failed to read password: ") + std::strerror(errno));
            }
            if (r == 0 || c == '\n') break;
            if (c != '\r') password.push_back(c);
        }
    }

    writeAll(tty.get(), "\n");
    return password;
}
