#pragma once

#include <string>
#include <cctype>
#include <algorithm>
#include <iterator>
#include <boost/json.hpp>

namespace devroute {

// Input checks shared by the CLI, the recipient parser and the config loader.
class InputValidator {
public:
    // Validates that a string is a correctly formatted hexadecimal sequence.
    static bool is_valid_hex(const std::string& str, size_t expected_length = 0) {
        if (str.empty()) return false;
        if (expected_length > 0 && str.length() != expected_length) return false;
        
        return std::all_of(str.begin(), str.end(), [](char c) {
            return std::isxdigit(static_cast<unsigned char>(c));
        });
    }
    
    // A textual device EUI is exactly 16 hex digits.
    static bool is_valid_device_id(const std::string& str) {
        return is_valid_hex(str, 16);
    }

    // Accepts only the request methods an HTTP recipient may be reached with.
    static bool is_valid_http_method(const std::string& method) {
        static const char* const allowed[] = {"GET", "POST", "PUT", "PATCH", "DELETE"};
        return std::any_of(std::begin(allowed), std::end(allowed), [&](const char* m) {
            return method == m;
        });
    }

    // Unsigned decimal integer with no sign, spaces or suffix.
    static bool is_valid_unsigned(const std::string& str) {
        if (str.empty() || str.size() > 18) return false;
        return std::all_of(str.begin(), str.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c));
        });
    }
    
    static bool is_within_size_limit(size_t size, size_t max_size) {
        return size <= max_size;
    }

    /**
     * JSON parsing with a recursion depth limit to prevent stack exhaustion.
     * Throws boost::system::system_error on malformed input.
     */
    static boost::json::value safe_parse_json(const std::string& input) {
        boost::json::parse_options opt;
        opt.max_depth = 16; 
        return boost::json::parse(input, {}, opt);
    }
};

}
