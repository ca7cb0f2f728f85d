#include "types/Item.hpp"
#include "types/Error.hpp"
#include "crypto/util/encrypt.hpp"
#include "util/timestamp.hpp"

#include <algorithm>

namespace dredge::types {

std::string to_string(const ItemKind kind) {
    switch (kind) {
        case ItemKind::Text: return "text";
        case ItemKind::File: return "file";
        default: throw std::invalid_argument("Unknown item kind");
    }
}

ItemKind item_kind_from_string(const std::string& str) {
    if (str == "text") return ItemKind::Text;
    if (str == "file") return ItemKind::File;
    throw Error(ErrorCode::Corrupted, "Unknown item type: " + str);
}

bool Item::hasTag(const std::string_view tag) const {
    return std::ranges::find(tags, tag) != tags.end();
}

void Item::touch() { modified = util::now(); }

static void addTags(Item& item, const std::vector<std::string>& tags) {
    for (const auto& tag : tags)
        if (!tag.empty() && !item.hasTag(tag)) item.tags.push_back(tag);
}

Item makeTextItem(const std::string& title, const std::string& content, const std::vector<std::string>& tags) {
    Item item;
    item.title = title;
    item.kind = ItemKind::Text;
    item.content = content;
    item.created = item.modified = util::now();
    addTags(item, tags);
    return item;
}

Item makeFileItem(const std::string& title, const std::string& filename, const std::vector<uint8_t>& bytes,
                  const std::vector<std::string>& tags) {
    Item item;
    item.title = title;
    item.kind = ItemKind::File;
    item.filename = filename;
    item.size = bytes.size();
    item.content = crypto::util::b64_encode(bytes);
    item.created = item.modified = util::now();
    addTags(item, tags);
    return item;
}

Item makeItemFromFile(const std::string& title, const std::string& filename, const std::vector<uint8_t>& bytes,
                      const std::vector<std::string>& tags) {
    if (isTextContent(bytes)) return makeTextItem(title, std::string(bytes.begin(), bytes.end()), tags);
    return makeFileItem(title, filename, bytes, tags);
}

void validate(const Item& item) {
    if (item.title.empty()) throw Error(ErrorCode::InvalidInput, "Item title cannot be empty");
    if (item.kind == ItemKind::File) {
        if (!item.filename || item.filename->empty())
            throw Error(ErrorCode::InvalidInput, "File item is missing a filename");
        if (!item.size) throw Error(ErrorCode::InvalidInput, "File item is missing a size");
    }
}

std::vector<uint8_t> decodeFileContent(const Item& item) {
    if (item.kind != ItemKind::File)
        throw Error(ErrorCode::InvalidInput, "Item '" + item.id + "' is not a file item");
    validate(item);

    auto bytes = crypto::util::b64_decode(item.content);
    if (bytes.size() != *item.size)
        throw Error(ErrorCode::Corrupted, "Size mismatch for item '" + item.id + "': expected " +
                                          std::to_string(*item.size) + " bytes, decoded " +
                                          std::to_string(bytes.size()));
    return bytes;
}

bool isTextContent(const std::vector<uint8_t>& bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        const uint8_t c = bytes[i];
        if (c == 0) return false;

        size_t continuation;
        if (c < 0x80) continuation = 0;
        else if ((c & 0xE0) == 0xC0 && c >= 0xC2) continuation = 1;
        else if ((c & 0xF0) == 0xE0) continuation = 2;
        else if ((c & 0xF8) == 0xF0 && c <= 0xF4) continuation = 3;
        else return false;

        if (i + continuation >= bytes.size() && continuation > 0) return false;
        for (size_t j = 1; j <= continuation; ++j)
            if ((bytes[i + j] & 0xC0) != 0x80) return false;

        // Overlongs, surrogates and code points above U+10FFFF
        if (continuation == 2) {
            if (c == 0xE0 && bytes[i + 1] < 0xA0) return false;
            if (c == 0xED && bytes[i + 1] >= 0xA0) return false;
        } else if (continuation == 3) {
            if (c == 0xF0 && bytes[i + 1] < 0x90) return false;
            if (c == 0xF4 && bytes[i + 1] >= 0x90) return false;
        }

        i += continuation + 1;
    }
    return true;
}

bool isValidId(const std::string_view id) {
    if (id.empty() || id.size() > MAX_ID_LENGTH) return false;
    return std::ranges::all_of(id, [](const char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
    });
}

void validateId(const std::string_view id) {
    if (!isValidId(id)) throw Error(ErrorCode::InvalidInput, "Invalid item ID: '" + std::string(id) + "'");
}

}
