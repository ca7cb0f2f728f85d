#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace dredge::crypto::hash {

inline constexpr std::string_view SHA256_PREFIX = "sha256:";

// "sha256:<64 lowercase hex>", streamed so large spawned files are never held in memory
std::string sha256(const std::filesystem::path& filepath);

std::string sha256(const std::vector<uint8_t>& data);

}
