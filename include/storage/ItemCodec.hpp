#pragma once

#include "types/Item.hpp"

#include <string>

namespace dredge::storage::codec {

// YAML record: title, tags, type, created, modified, [filename, size], content.text
std::string encode(const types::Item& item);

// Throws Corrupted if the record is not a well-formed item
types::Item decode(const std::string& yaml, const std::string& id);

}
