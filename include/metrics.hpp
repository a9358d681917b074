#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>

namespace devroute {

// Counters recorded by the store, the backends and the router.
enum class Counter {
    RegistrationStored,
    RegistrationDuplicate,
    RegistrationRejected,
    RegistrationExpired,
    RegistrationCorrupt,
    BackendFailure,
    PacketsRouted,
    PacketsDropped,
    Count_
};

 
// Process-wide registry of router storage counters.
// Counters are lock-free; the registry is shared by every store instance in
// the process, so values aggregate across stores.
class MetricsRegistry {
public:
    static constexpr size_t COUNTER_COUNT = static_cast<size_t>(Counter::Count_);

    static MetricsRegistry& instance() {
        static MetricsRegistry instance;
        return instance;
    }

    void increment(Counter counter, uint64_t value = 1) {
        counters_[index(counter)].fetch_add(value, std::memory_order_relaxed);
    }

    uint64_t get(Counter counter) const {
        return counters_[index(counter)].load(std::memory_order_relaxed);
    }

    // Zeroes every counter. Intended for tests.
    void reset() {
        for (auto& c : counters_) {
            c.store(0, std::memory_order_relaxed);
        }
    }

    // Exported metric name, e.g. "devroute_registration_stored_total".
    static const char* name(Counter counter) {
        switch (counter) {
            case Counter::RegistrationStored: return "devroute_registration_stored_total";
            case Counter::RegistrationDuplicate: return "devroute_registration_duplicate_total";
            case Counter::RegistrationRejected: return "devroute_registration_rejected_total";
            case Counter::RegistrationExpired: return "devroute_registration_expired_total";
            case Counter::RegistrationCorrupt: return "devroute_registration_corrupt_total";
            case Counter::BackendFailure: return "devroute_backend_failure_total";
            case Counter::PacketsRouted: return "devroute_packets_routed_total";
            case Counter::PacketsDropped: return "devroute_packets_dropped_total";
            default: return "devroute_unknown_total";
        }
    }

    static const char* help(Counter counter) {
        switch (counter) {
            case Counter::RegistrationStored: return "Registrations written to the backend.";
            case Counter::RegistrationDuplicate: return "Registrations refused because a live entry exists.";
            case Counter::RegistrationRejected: return "Registrations refused by the router for any reason.";
            case Counter::RegistrationExpired: return "Expired entries flushed on access.";
            case Counter::RegistrationCorrupt: return "Keys flushed because they held more than one entry.";
            case Counter::BackendFailure: return "Failed backend operations.";
            case Counter::PacketsRouted: return "Packets resolved to a recipient.";
            case Counter::PacketsDropped: return "Packets dropped for an unknown device or empty payload.";
            default: return "";
        }
    }

    /**
     * Serializes every counter into Prometheus exposition format (text version 0.0.4).
     */
    std::string collect_prometheus() const {
        std::stringstream ss;
        for (size_t i = 0; i < COUNTER_COUNT; ++i) {
            auto counter = static_cast<Counter>(i);
            ss << "# HELP " << name(counter) << " " << help(counter) << "\n";
            ss << "# TYPE " << name(counter) << " counter\n";
            ss << name(counter) << " " << get(counter) << "\n";
        }
        return ss.str();
    }

private:
    MetricsRegistry() {
        reset();
    }

    static size_t index(Counter counter) {
        return static_cast<size_t>(counter);
    }

    std::array<std::atomic<uint64_t>, COUNTER_COUNT> counters_;
};

}
