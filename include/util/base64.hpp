#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "util/status.hpp"

namespace b64
{

// Standard alphabet, padded (libsodium ORIGINAL variant)
std::string encode(const std::vector<std::uint8_t> &bytes);

// Whitespace-free input only; anything else is InvalidRequest
webble::Status decode(std::string_view text, std::vector<std::uint8_t> &out);

}  // namespace b64
