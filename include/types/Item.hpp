#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dredge::types {

enum class ItemKind { Text, File };

std::string to_string(ItemKind kind);
ItemKind item_kind_from_string(const std::string& str);

struct Item {
    std::string id;     // filename of the item record, never serialized
    std::string title;
    std::vector<std::string> tags;
    ItemKind kind = ItemKind::Text;
    std::optional<std::string> filename;
    std::optional<uint64_t> size;
    std::time_t created{}, modified{};
    std::string content;    // plaintext for Text, base64 for File

    [[nodiscard]] bool isText() const { return kind == ItemKind::Text; }
    [[nodiscard]] bool hasTag(std::string_view tag) const;

    void touch();
};

Item makeTextItem(const std::string& title, const std::string& content, const std::vector<std::string>& tags = {});
Item makeFileItem(const std::string& title, const std::string& filename, const std::vector<uint8_t>& bytes,
                  const std::vector<std::string>& tags = {});

// Text when the bytes are NUL-free UTF-8, File otherwise
Item makeItemFromFile(const std::string& title, const std::string& filename, const std::vector<uint8_t>& bytes,
                      const std::vector<std::string>& tags = {});

// Throws InvalidInput
void validate(const Item& item);

// Throws InvalidInput for Text items, Corrupted on bad base64 or a size mismatch
std::vector<uint8_t> decodeFileContent(const Item& item);

bool isTextContent(const std::vector<uint8_t>& bytes);

constexpr size_t MAX_ID_LENGTH = 64;

// 1..64 chars of [A-Za-z0-9_-]
bool isValidId(std::string_view id);
void validateId(std::string_view id);

}
