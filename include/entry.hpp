#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace devroute {

using TimePoint = std::chrono::system_clock::time_point;

// One active registration as persisted by the store.
// expires_at is absent for entries written while expiry was disabled.
struct Entry {
    std::string recipient;
    std::optional<TimePoint> expires_at;
};

inline bool operator==(const Entry& a, const Entry& b) {
    return a.recipient == b.recipient && a.expires_at == b.expires_at;
}

inline bool operator!=(const Entry& a, const Entry& b) {
    return !(a == b);
}

// Converts entries to and from their persisted byte layout:
//   record(recipient) [record(timestamp)]
// where the timestamp is 13 bytes: version 0x01, int64 BE unix seconds,
// int32 BE nanoseconds.
class EntryCodec {
public:
    static constexpr uint8_t TIMESTAMP_VERSION = 0x01;
    static constexpr size_t TIMESTAMP_SIZE = 13;

    static std::string encode(const Entry& entry);

    // Throws Failure(Structural) on a missing recipient record, a malformed
    // timestamp record or trailing bytes.
    static Entry decode(std::string_view data);

    static std::string encode_timestamp(TimePoint tp);
    static TimePoint decode_timestamp(std::string_view data);
};

}
