#include "entry.hpp"
#include "errors.hpp"
#include "record_codec.hpp"
#include <algorithm>

namespace devroute {

namespace {

void put_be(std::string& out, uint64_t value, int width) {
    for (int i = width - 1; i >= 0; --i) {
        out += static_cast<char>((value >> (8 * i)) & 0xff);
    }
}

// Seconds range for which seconds + nanoseconds converts to a system_clock
// time point without overflow.
constexpr int64_t MAX_TIMESTAMP_SECONDS =
    std::min(std::chrono::duration_cast<std::chrono::seconds>(std::chrono::nanoseconds::max()).count(),
             std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::duration::max()).count()) - 1;
constexpr int64_t MIN_TIMESTAMP_SECONDS =
    std::max(std::chrono::duration_cast<std::chrono::seconds>(std::chrono::nanoseconds::min()).count(),
             std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::duration::min()).count()) + 1;

uint64_t get_be(std::string_view in, size_t offset, int width) {
    uint64_t value = 0;
    for (int i = 0; i < width; ++i) {
        value = (value << 8) | static_cast<unsigned char>(in[offset + i]);
    }
    return value;
}

}

std::string EntryCodec::encode_timestamp(TimePoint tp) {
    using namespace std::chrono;
    auto since_epoch = duration_cast<nanoseconds>(tp.time_since_epoch());
    auto secs = duration_cast<seconds>(since_epoch);
    if (secs > since_epoch) {
        secs -= seconds(1); // floor for pre-epoch instants
    }
    auto nanos = (since_epoch - secs).count();

    std::string out;
    out.reserve(TIMESTAMP_SIZE);
    out += static_cast<char>(TIMESTAMP_VERSION);
    put_be(out, static_cast<uint64_t>(secs.count()), 8);
    put_be(out, static_cast<uint64_t>(nanos), 4);
    return out;
}

TimePoint EntryCodec::decode_timestamp(std::string_view data) {
    using namespace std::chrono;
    if (data.size() != TIMESTAMP_SIZE) {
        throw Failure(Nature::Structural, "Invalid timestamp length");
    }
    if (static_cast<uint8_t>(data[0]) != TIMESTAMP_VERSION) {
        throw Failure(Nature::Structural, "Unsupported timestamp version");
    }
    auto secs = static_cast<int64_t>(get_be(data, 1, 8));
    auto nanos = static_cast<int64_t>(get_be(data, 9, 4));
    if (nanos >= 1000000000) {
        throw Failure(Nature::Structural, "Timestamp nanoseconds out of range");
    }
    if (secs > MAX_TIMESTAMP_SECONDS || secs < MIN_TIMESTAMP_SECONDS) {
        throw Failure(Nature::Structural, "Timestamp seconds out of range");
    }
    auto since_epoch = seconds(secs) + nanoseconds(nanos);
    return TimePoint(duration_cast<system_clock::duration>(since_epoch));
}

std::string EntryCodec::encode(const Entry& entry) {
    RecordWriter writer;
    writer.write(entry.recipient);
    if (entry.expires_at) {
        writer.write(encode_timestamp(*entry.expires_at));
    }
    return writer.bytes();
}

Entry EntryCodec::decode(std::string_view data) {
    RecordReader reader(data);
    Entry entry;
    entry.recipient = reader.read();
    if (auto ts = reader.try_read()) {
        entry.expires_at = decode_timestamp(*ts);
    }
    if (!reader.exhausted()) {
        throw Failure(Nature::Structural, "Unexpected trailing bytes after entry");
    }
    return entry;
}

}
