#include "util/files.hpp"
#include "types/Error.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>

namespace fs = std::filesystem;

namespace dredge::util {

static std::string errnoString() { return std::strerror(errno); }

static mode_t toMode(const fs::perms perms) {
    return static_cast<mode_t>(perms & fs::perms::mask);
}

std::vector<uint8_t> readFileToVector(const fs::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw Error(ErrorCode::IOFailure, "Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (size > 0 && !in.read(reinterpret_cast<char*>(buffer.data()), size))
        throw Error(ErrorCode::IOFailure, "Failed to read file: " + path.string());

    return buffer;
}

std::string readFileToString(const fs::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw Error(ErrorCode::IOFailure, "Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(static_cast<size_t>(size), '\0');
    if (size > 0 && !in.read(buffer.data(), size))
        throw Error(ErrorCode::IOFailure, "Failed to read file: " + path.string());

    return buffer;
}

// Writes `data` into a fresh temp file beside `path` and returns the temp file's name.
static std::string writeTemp(const fs::path& path, const std::string_view data, const fs::perms perms) {
    std::string tmpl = path.string() + ".tmpXXXXXX";
    const int fd = mkostemp(tmpl.data(), O_CLOEXEC);
    if (fd < 0)
        throw Error(ErrorCode::IOFailure, "Failed to create temp file for " + path.string() + ": " + errnoString());

    const auto fail = [&](const std::string& what) {
        const auto reason = errnoString();
        ::close(fd);
        ::unlink(tmpl.c_str());
        throw Error(ErrorCode::IOFailure, what + " " + path.string() + ": " + reason);
    };

    if (fchmod(fd, toMode(perms)) != 0) fail("Failed to set permissions on temp file for");

    size_t written = 0;
    while (written < data.size()) {
        const ssize_t w = ::write(fd, data.data() + written, data.size() - written);
        if (w < 0) {
            if (errno == EINTR) continue;
            fail("Failed to write temp file for");
        }
        written += static_cast<size_t>(w);
    }

    if (fsync(fd) != 0) fail("Failed to fsync temp file for");
    if (::close(fd) != 0) {
        const auto reason = errnoString();
        ::unlink(tmpl.c_str());
        throw Error(ErrorCode::IOFailure, "Failed to close temp file for " + path.string() + ": " + reason);
    }

    return tmpl;
}

void atomicWrite(const fs::path& path, const std::string_view data, const fs::perms perms) {
    const auto tmp = writeTemp(path, data, perms);
    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        const auto reason = errnoString();
        ::unlink(tmp.c_str());
        throw Error(ErrorCode::IOFailure, "Failed to replace " + path.string() + ": " + reason);
    }
}

void atomicWrite(const fs::path& path, const std::vector<uint8_t>& data, const fs::perms perms) {
    atomicWrite(path, std::string_view(reinterpret_cast<const char*>(data.data()), data.size()), perms);
}

void createExclusive(const fs::path& path, const std::vector<uint8_t>& data, const fs::perms perms) {
    const auto tmp = writeTemp(path, std::string_view(reinterpret_cast<const char*>(data.data()), data.size()), perms);

    // link(2) refuses to replace an existing name, unlike rename(2)
    if (::link(tmp.c_str(), path.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp.c_str());
        if (err == EEXIST) throw Error(ErrorCode::AlreadyExists, "File already exists: " + path.string());
        throw Error(ErrorCode::IOFailure, "Failed to create " + path.string() + ": " + std::strerror(err));
    }
    ::unlink(tmp.c_str());
}

void renamePath(const fs::path& from, const fs::path& to) {
    if (::rename(from.c_str(), to.c_str()) != 0)
        throw Error(ErrorCode::IOFailure, "Failed to rename " + from.string() + " to " + to.string() + ": " + errnoString());
}

void moveNoReplace(const fs::path& from, const fs::path& to) {
    if (::link(from.c_str(), to.c_str()) != 0) {
        const int err = errno;
        if (err == EEXIST) throw Error(ErrorCode::AlreadyExists, "File already exists: " + to.string());
        if (std::error_code ec; err == ENOENT && !fs::exists(from, ec) && !ec)
            throw Error(ErrorCode::NotFound, "No such file: " + from.string());
        throw Error(ErrorCode::IOFailure, "Failed to move " + from.string() + " to " + to.string() + ": " +
                                          std::strerror(err));
    }
    if (::unlink(from.c_str()) != 0) {
        const auto reason = errnoString();
        ::unlink(to.c_str());
        throw Error(ErrorCode::IOFailure, "Failed to move " + from.string() + ": " + reason);
    }
}

bool removeIfExists(const fs::path& path) {
    if (::unlink(path.c_str()) == 0) return true;
    if (errno == ENOENT) return false;
    throw Error(ErrorCode::IOFailure, "Failed to remove " + path.string() + ": " + errnoString());
}

void ensureDirectory(const fs::path& dir, const fs::perms perms) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw Error(ErrorCode::IOFailure, "Failed to create directory " + dir.string() + ": " + ec.message());
    if (!fs::is_directory(dir, ec))
        throw Error(ErrorCode::IOFailure, dir.string() + " exists but is not a directory");

    fs::permissions(dir, perms, fs::perm_options::replace, ec);
    if (ec) throw Error(ErrorCode::IOFailure, "Failed to set permissions on " + dir.string() + ": " + ec.message());
}

void ensureSharedDirectory(const fs::path& dir, const fs::perms perms) {
    std::error_code ec;
    if (fs::is_directory(dir, ec)) return;

    if (!fs::create_directories(dir, ec) && ec)
        throw Error(ErrorCode::IOFailure, "Failed to create directory " + dir.string() + ": " + ec.message());
    if (!fs::is_directory(dir, ec))
        throw Error(ErrorCode::IOFailure, dir.string() + " exists but is not a directory");

    fs::permissions(dir, perms, fs::perm_options::replace, ec);
    if (ec) throw Error(ErrorCode::IOFailure, "Failed to set permissions on " + dir.string() + ": " + ec.message());
}

std::size_t countDirectoryEntries(const fs::path& dir) {
    std::error_code ec;
    std::size_t count = 0;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) ++count;
    if (ec) throw Error(ErrorCode::IOFailure, "Failed to list " + dir.string() + ": " + ec.message());
    return count;
}

}
