#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace dredge::util {

constexpr auto OWNER_RW = std::filesystem::perms::owner_read | std::filesystem::perms::owner_write;
constexpr auto OWNER_RWX = std::filesystem::perms::owner_all;

std::vector<uint8_t> readFileToVector(const std::filesystem::path& path);
std::string readFileToString(const std::filesystem::path& path);

// Writes to a sibling temp file, fsyncs, then renames over `path`.
// Readers observe either the old or the new content, never a partial write.
void atomicWrite(const std::filesystem::path& path, std::string_view data,
                 std::filesystem::perms perms = OWNER_RW);
void atomicWrite(const std::filesystem::path& path, const std::vector<uint8_t>& data,
                 std::filesystem::perms perms = OWNER_RW);

// Like atomicWrite, but fails with AlreadyExists instead of replacing an existing file.
void createExclusive(const std::filesystem::path& path, const std::vector<uint8_t>& data,
                     std::filesystem::perms perms = OWNER_RW);

// rename(2); replaces an existing file at `to`
void renamePath(const std::filesystem::path& from, const std::filesystem::path& to);

// Like renamePath, but fails with AlreadyExists instead of replacing `to`. Regular files only.
void moveNoReplace(const std::filesystem::path& from, const std::filesystem::path& to);

// Returns false if nothing existed at `path`. Symlinks are removed, not followed.
bool removeIfExists(const std::filesystem::path& path);

void ensureDirectory(const std::filesystem::path& dir, std::filesystem::perms perms = OWNER_RWX);

// Applies `perms` only to a directory it creates; an existing one keeps its mode
void ensureSharedDirectory(const std::filesystem::path& dir, std::filesystem::perms perms = OWNER_RWX);

std::size_t countDirectoryEntries(const std::filesystem::path& dir);

}
