#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace devroute {

// 8-byte device EUI. Used verbatim as the backend key.
using DeviceId = std::array<uint8_t, 8>;

// Lowercase hex rendering of arbitrary bytes.
std::string encode_hex(std::string_view bytes);

std::string to_hex(const DeviceId& id);

// Parses 16 hex digits. Throws Failure(Structural) on anything else.
DeviceId parse_device_id(const std::string& text);

// Raw 8-byte key as stored in the backend.
std::string device_key(const DeviceId& id);

}
