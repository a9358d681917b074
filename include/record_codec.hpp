#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace devroute {

// Length-prefixed record framing: every record is a 4-byte big-endian
// length followed by that many payload bytes.
class RecordWriter {
public:
    static constexpr size_t MAX_RECORD_SIZE = 0xFFFFFFFFu;

    // Appends one record. Throws Failure(Structural) if the payload is too large.
    RecordWriter& write(std::string_view data);

    const std::string& bytes() const { return buffer_; }

private:
    std::string buffer_;
};

class RecordReader {
public:
    explicit RecordReader(std::string_view data) : data_(data) {}

    // Reads the next record. Throws Failure(Structural) if none is available.
    std::string read();

    /**
     * Reads an optional record.
     * @return std::nullopt when no bytes remain.
     * Throws Failure(Structural) when bytes remain but do not form a record.
     */
    std::optional<std::string> try_read();

    bool exhausted() const { return pos_ >= data_.size(); }
    size_t remaining() const { return data_.size() - pos_; }

private:
    std::string_view data_;
    size_t pos_ = 0;
};

}
