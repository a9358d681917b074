#include "router_config.hpp"
#include "errors.hpp"
#include "input_validator.hpp"
#include <cstdlib>

namespace devroute {

std::chrono::seconds parse_expiry_seconds(const std::string& text) {
    if (!InputValidator::is_valid_unsigned(text)) {
        throw Failure(Nature::Structural, "Invalid expiry delay '" + text + "': expected seconds >= 0");
    }
    std::chrono::seconds delay(std::stoll(text));
    if (delay > MAX_EXPIRY_DELAY) {
        throw Failure(Nature::Structural, "Expiry delay '" + text + "' exceeds " +
                      std::to_string(MAX_EXPIRY_DELAY.count()) + " seconds");
    }
    return delay;
}

void load_config_from_env(RouterConfig& config) {
    if (const char* e = std::getenv("DEVROUTE_BACKEND_URL")) {
        config.backend_url = e;
    }
    if (const char* e = std::getenv("DEVROUTE_TABLE")) {
        if (*e == '\0') {
            throw Failure(Nature::Structural, "DEVROUTE_TABLE must not be empty");
        }
        config.table_name = e;
    }
    if (const char* e = std::getenv("DEVROUTE_EXPIRY_SEC")) {
        config.expiry_delay = parse_expiry_seconds(e);
    }
    if (const char* e = std::getenv("DEVROUTE_REDIS_PASSWORD")) {
        config.redis_password = e;
    }
}

}
