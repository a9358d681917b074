#pragma once

#include <string>
#include <chrono>

namespace devroute {

// Largest expiry delay accepted. Half the system clock range, so that
// now + delay stays representable for any realistic now.
constexpr std::chrono::seconds MAX_EXPIRY_DELAY =
    std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::duration::max()) / 2;

 
// Router storage configuration.
struct RouterConfig {
    // --- Backend ---
    // memory:// for the in-process store, tcp://host:port or unix:///path for Redis.
    std::string backend_url = "memory://";
    std::string redis_password = "";
    int redis_connect_timeout_ms = 200;

    // Table (key namespace) the registrations live under.
    std::string table_name = "router";

    // --- Registration lifetime ---
    // Zero disables expiry entirely.
    std::chrono::seconds expiry_delay{0};
};

/**
 * Applies DEVROUTE_* environment overrides on top of the given config.
 * Throws Failure(Structural) when a numeric variable is malformed.
 */
void load_config_from_env(RouterConfig& config);

/**
 * Parses a number of seconds in [0, MAX_EXPIRY_DELAY].
 * Throws Failure(Structural) on anything else.
 */
std::chrono::seconds parse_expiry_seconds(const std::string& text);

} 
