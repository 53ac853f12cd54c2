#pragma once
#include <string>
#include <string_view>

#include "util/status.hpp"

namespace gatt
{

// Canonical lowercase 128-bit form of a UUID token. Accepts 4 or 8 hex digits
// (optionally 0x-prefixed, expanded over the Bluetooth base UUID), 32 bare hex
// digits, or the hyphenated 36-char form (optionally in braces).
webble::Status normalize_uuid(std::string_view token, std::string &out);

// Compares two tokens after normalization; malformed tokens never compare equal.
bool uuid_eq(std::string_view a, std::string_view b);

}  // namespace gatt
