#include "storage/ItemCodec.hpp"
#include "types/Error.hpp"
#include "util/timestamp.hpp"

#include <yaml-cpp/yaml.h>

#include <vector>

namespace dredge::storage::codec {

using types::Item;
using types::ItemKind;

namespace {

constexpr auto BINARY_TAG = "tag:yaml.org,2002:binary";

// Text that is not valid UTF-8 goes out as !!binary; the emitter would otherwise substitute U+FFFD
void emitContent(YAML::Emitter& out, const std::string& content) {
    const std::vector<uint8_t> raw(content.begin(), content.end());
    if (types::isTextContent(raw)) out << YAML::DoubleQuoted << content;
    else out << YAML::Binary(raw.data(), raw.size());
}

std::string parseContent(const YAML::Node& node) {
    if (!node) return {};
    if (node.Tag() == BINARY_TAG || node.Tag() == "!!binary") {
        const auto bin = node.as<YAML::Binary>();
        return {reinterpret_cast<const char*>(bin.data()), bin.size()};
    }
    return node.as<std::string>("");
}

}

std::string encode(const Item& item) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "title" << YAML::Value << item.title;
    if (!item.tags.empty()) out << YAML::Key << "tags" << YAML::Value << YAML::Flow << item.tags;
    out << YAML::Key << "type" << YAML::Value << types::to_string(item.kind);
    out << YAML::Key << "created" << YAML::Value << util::timestampToString(item.created);
    out << YAML::Key << "modified" << YAML::Value << util::timestampToString(item.modified);
    if (item.kind == ItemKind::File) {
        out << YAML::Key << "filename" << YAML::Value << item.filename.value_or("");
        out << YAML::Key << "size" << YAML::Value << item.size.value_or(0);
    }
    out << YAML::Key << "content" << YAML::Value
        << YAML::BeginMap << YAML::Key << "text" << YAML::Value;
    emitContent(out, item.content);
    out << YAML::EndMap;
    out << YAML::EndMap;

    if (!out.good()) throw Error(ErrorCode::InvalidInput, std::string("Failed to encode item: ") + out.GetLastError());
    return {out.c_str(), out.size()};
}

Item decode(const std::string& yaml, const std::string& id) {
    Item item;
    item.id = id;

    try {
        const YAML::Node root = YAML::Load(yaml);
        if (!root.IsMap()) throw Error(ErrorCode::Corrupted, "Item '" + id + "' is not a YAML mapping");

        item.title = root["title"].as<std::string>("");
        if (const auto tags = root["tags"]) item.tags = tags.as<std::vector<std::string>>();
        item.kind = types::item_kind_from_string(root["type"].as<std::string>("text"));

        if (const auto created = root["created"]) item.created = util::parseTimestampFromString(created.as<std::string>());
        if (const auto modified = root["modified"]) item.modified = util::parseTimestampFromString(modified.as<std::string>());

        if (const auto filename = root["filename"]) item.filename = filename.as<std::string>();
        if (const auto size = root["size"]) item.size = size.as<uint64_t>();

        const auto content = root["content"];
        if (!content || !content.IsMap())
            throw Error(ErrorCode::Corrupted, "Item '" + id + "' has no content section");
        item.content = parseContent(content["text"]);
    } catch (const YAML::Exception& e) {
        throw Error(ErrorCode::Corrupted, "Failed to parse item '" + id + "': " + e.what());
    }

    try {
        types::validate(item);
    } catch (const Error& e) {
        throw Error(ErrorCode::Corrupted, "Item '" + id + "' failed validation: " + e.what());
    }

    return item;
}

}
