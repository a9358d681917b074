#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include "device_id.hpp"
#include "entry.hpp"
#include "key_value_backend.hpp"
#include "recipient.hpp"

namespace devroute {

struct RouterConfig;

struct StoreOptions {
    std::string table_name = "router";
    // Zero disables expiry. Must not exceed MAX_EXPIRY_DELAY.
    std::chrono::seconds expiry_delay{0};
    // Source of "now". Defaults to the system clock.
    std::function<TimePoint()> clock;
};

 
// Time-expiring device -> recipient registration store.
//
// At most one live entry exists per device. Expired entries, and keys that
// hold anything other than exactly one entry, are flushed when observed and
// reported as NotFound. There is no background eviction.
//
// A single mutex serializes every lookup and store on the instance so the
// check-then-write in store() cannot race.
class RegistrationStore {
public:
    // Throws Failure(Operational) without a backend, Failure(Structural) when
    // the expiry delay is negative or above MAX_EXPIRY_DELAY.
    RegistrationStore(std::unique_ptr<KeyValueBackend> backend, StoreOptions options);
    ~RegistrationStore() = default;

    RegistrationStore(const RegistrationStore&) = delete;
    RegistrationStore& operator=(const RegistrationStore&) = delete;

    /**
     * Builds the store and its backend from configuration.
     * Throws Failure(Operational) if the backend cannot be constructed.
     */
    static std::unique_ptr<RegistrationStore> open(const RouterConfig& config);

    /**
     * Resolves the live entry for a device.
     * Throws Failure(NotFound) when absent, expired or corrupt,
     * Failure(Structural) when a stored record cannot be decoded,
     * Failure(Operational) on backend failure.
     */
    Entry lookup(const DeviceId& device_id);

    /**
     * Registers a device. Not an upsert.
     * Throws Failure(Structural) when the recipient cannot be serialized or a
     * live entry already exists; backend failures propagate unchanged.
     */
    void store(const Registration& registration);

    // Closes the backend.
    void close();

    const std::string& table_name() const { return options_.table_name; }
    std::chrono::seconds expiry_delay() const { return options_.expiry_delay; }

private:
    // Caller must hold mutex_; the guard parameter proves it.
    Entry lookup_locked(const DeviceId& device_id, const std::lock_guard<std::mutex>& held);

    bool is_expired(const Entry& entry, TimePoint now) const;

    std::unique_ptr<KeyValueBackend> backend_;
    StoreOptions options_;
    std::mutex mutex_;
};

}
