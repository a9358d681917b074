#include "device_id.hpp"
#include "errors.hpp"
#include "input_validator.hpp"

namespace devroute {

namespace {

uint8_t hex_nibble(char c) {
    if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
    return static_cast<uint8_t>(c - 'A' + 10);
}

}

std::string encode_hex(std::string_view bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (char c : bytes) {
        auto b = static_cast<unsigned char>(c);
        out += digits[b >> 4];
        out += digits[b & 0x0f];
    }
    return out;
}

std::string to_hex(const DeviceId& id) {
    return encode_hex(device_key(id));
}

DeviceId parse_device_id(const std::string& text) {
    if (!InputValidator::is_valid_device_id(text)) {
        throw Failure(Nature::Structural, "Invalid device EUI: expected 16 hex digits");
    }
    DeviceId id{};
    for (size_t i = 0; i < id.size(); ++i) {
        id[i] = static_cast<uint8_t>((hex_nibble(text[2 * i]) << 4) | hex_nibble(text[2 * i + 1]));
    }
    return id;
}

std::string device_key(const DeviceId& id) {
    return std::string(reinterpret_cast<const char*>(id.data()), id.size());
}

}
