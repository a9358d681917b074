#include "record_codec.hpp"
#include "errors.hpp"

namespace devroute {

RecordWriter& RecordWriter::write(std::string_view data) {
    if (data.size() > MAX_RECORD_SIZE) {
        throw Failure(Nature::Structural, "Record exceeds maximum encodable size");
    }
    uint32_t len = static_cast<uint32_t>(data.size());
    buffer_ += static_cast<char>((len >> 24) & 0xff);
    buffer_ += static_cast<char>((len >> 16) & 0xff);
    buffer_ += static_cast<char>((len >> 8) & 0xff);
    buffer_ += static_cast<char>(len & 0xff);
    buffer_.append(data.data(), data.size());
    return *this;
}

std::string RecordReader::read() {
    if (remaining() < 4) {
        throw Failure(Nature::Structural, "Truncated record header");
    }
    uint32_t len = 0;
    for (int i = 0; i < 4; ++i) {
        len = (len << 8) | static_cast<unsigned char>(data_[pos_ + i]);
    }
    if (remaining() - 4 < len) {
        throw Failure(Nature::Structural, "Truncated record payload");
    }
    std::string out(data_.substr(pos_ + 4, len));
    pos_ += 4 + static_cast<size_t>(len);
    return out;
}

std::optional<std::string> RecordReader::try_read() {
    if (exhausted()) return std::nullopt;
    return read();
}

}
