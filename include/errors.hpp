#pragma once

#include <stdexcept>
#include <string>

namespace devroute {

// Classifies every failure surfaced by the router storage layer.
enum class Nature {
    NotFound,     // Absent, expired or corrupt-count registration
    Structural,   // Bad caller data, duplicate registration, malformed bytes
    Operational   // Backend construction, I/O, flush or close failure
};

inline const char* nature_to_string(Nature nature) {
    switch (nature) {
        case Nature::NotFound: return "NotFound";
        case Nature::Structural: return "Structural";
        case Nature::Operational: return "Operational";
        default: return "Unknown";
    }
}

// Exception type thrown by the store, codecs and backends.
class Failure : public std::runtime_error {
public:
    Failure(Nature nature, const std::string& what)
        : std::runtime_error(what), nature_(nature) {}

    Nature nature() const { return nature_; }

    bool is(Nature nature) const { return nature_ == nature; }

private:
    Nature nature_;
};

}
