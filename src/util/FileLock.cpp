#include "util/FileLock.hpp"
#include "types/Error.hpp"
#include "log/Registry.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace dredge::util {

unique_fd::~unique_fd() { if (fd_ >= 0) ::close(fd_); }

unique_fd& unique_fd::operator=(unique_fd&& o) noexcept {
    if (this != &o) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = o.fd_;
        o.fd_ = -1;
    }
    return *this;
}

void unique_fd::reset(const int fd) noexcept {
    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
}

FileLock::FileLock(const std::filesystem::path& path) : path_(path) {
    fd_.reset(::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600));
    if (!fd_)
        throw Error(ErrorCode::IOFailure, "Cannot open lock file " + path.string() + ": " + std::strerror(errno));

    while (flock(fd_.get(), LOCK_EX) != 0) {
        if (errno == EINTR) continue;
        throw Error(ErrorCode::IOFailure, "flock failed on " + path.string() + ": " + std::strerror(errno));
    }

    log::Registry::dredge()->debug("[FileLock] Acquired {}", path_.string());
}

FileLock::~FileLock() {
    if (fd_) flock(fd_.get(), LOCK_UN);
}

}
