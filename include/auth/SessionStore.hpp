#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>

#include <sys/types.h>

namespace dredge::auth {

// Key/value state that lives as long as the calling shell session
class SessionStore {
public:
    virtual ~SessionStore() = default;

    [[nodiscard]] virtual std::optional<std::string> get(const std::string& key) const = 0;
    virtual void put(const std::string& key, const std::string& value) = 0;
    virtual void erase(const std::string& key) = 0;
};

// One directory per parent process under a volatile root, so sibling
// invocations from the same shell see the same entries.
class FileSessionStore final : public SessionStore {
public:
    explicit FileSessionStore(const std::filesystem::path& root);
    FileSessionStore(const std::filesystem::path& root, pid_t owner);

    // Uses the configured session root and getppid()
    static FileSessionStore forParentProcess();

    [[nodiscard]] std::optional<std::string> get(const std::string& key) const override;
    void put(const std::string& key, const std::string& value) override;
    void erase(const std::string& key) override;

    [[nodiscard]] const std::filesystem::path& dir() const { return dir_; }

private:
    std::filesystem::path root_, dir_;

    [[nodiscard]] std::filesystem::path entryPath(const std::string& key) const;
};

class MemorySessionStore final : public SessionStore {
public:
    [[nodiscard]] std::optional<std::string> get(const std::string& key) const override;
    void put(const std::string& key, const std::string& value) override;
    void erase(const std::string& key) override;

private:
    std::unordered_map<std::string, std::string> entries_;
};

}
