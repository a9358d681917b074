#include "registration_store.hpp"
#include "router_config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "metrics.hpp"

namespace devroute {

RegistrationStore::RegistrationStore(std::unique_ptr<KeyValueBackend> backend, StoreOptions options)
    : backend_(std::move(backend)), options_(std::move(options)) {
    if (!backend_) {
        throw Failure(Nature::Operational, "Registration store requires a backend");
    }
    if (!options_.clock) {
        options_.clock = [] { return std::chrono::system_clock::now(); };
    }
    if (options_.expiry_delay < std::chrono::seconds::zero() || options_.expiry_delay > MAX_EXPIRY_DELAY) {
        throw Failure(Nature::Structural, "Expiry delay out of range: " +
                      std::to_string(options_.expiry_delay.count()) + "s");
    }
}

std::unique_ptr<RegistrationStore> RegistrationStore::open(const RouterConfig& config) {
    std::unique_ptr<KeyValueBackend> backend;
    try {
        backend = make_backend(config);
    } catch (const Failure& e) {
        throw Failure(Nature::Operational, std::string("Cannot open registration backend: ") + e.what());
    }

    StoreOptions options;
    options.table_name = config.table_name;
    options.expiry_delay = config.expiry_delay;
    return std::make_unique<RegistrationStore>(std::move(backend), std::move(options));
}

Entry RegistrationStore::lookup(const DeviceId& device_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookup_locked(device_id, lock);
}

bool RegistrationStore::is_expired(const Entry& entry, TimePoint now) const {
    if (options_.expiry_delay == std::chrono::seconds::zero()) return false;
    // Entries written while expiry was disabled carry no deadline and are
    // considered stale once expiry is turned on.
    if (!entry.expires_at) return true;
    return *entry.expires_at < now;
}

Entry RegistrationStore::lookup_locked(const DeviceId& device_id, const std::lock_guard<std::mutex>&) {
    const std::string key = device_key(device_id);

    std::vector<Entry> entries;
    for (const auto& record : backend_->lookup(options_.table_name, key)) {
        entries.push_back(EntryCodec::decode(record));
    }

    if (entries.size() != 1) {
        if (entries.size() > 1) {
            MetricsRegistry::instance().increment(Counter::RegistrationCorrupt);
            Logger::log(Logger::Level::WARNING, Logger::Event::ENTRY_CORRUPTED, to_hex(device_id),
                        std::to_string(entries.size()) + " entries under one key, flushing");
        }
        backend_->flush(options_.table_name, key);
        throw Failure(Nature::NotFound, "Not Found");
    }

    Entry& entry = entries.front();
    if (is_expired(entry, options_.clock())) {
        MetricsRegistry::instance().increment(Counter::RegistrationExpired);
        Logger::log(Logger::Level::DEBUG, Logger::Event::ENTRY_EXPIRED, to_hex(device_id));
        backend_->flush(options_.table_name, key);
        throw Failure(Nature::NotFound, "Not Found");
    }

    return std::move(entry);
}

void RegistrationStore::store(const Registration& registration) {
    const DeviceId device_id = registration.device_id();

    std::string recipient;
    try {
        recipient = registration.recipient().marshal_binary();
    } catch (const std::exception& e) {
        throw Failure(Nature::Structural, std::string("Cannot serialize recipient: ") + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);

    bool exists = true;
    try {
        lookup_locked(device_id, lock);
    } catch (const Failure& e) {
        if (!e.is(Nature::NotFound)) throw;
        exists = false;
    }
    if (exists) {
        MetricsRegistry::instance().increment(Counter::RegistrationDuplicate);
        Logger::log(Logger::Level::INFO, Logger::Event::REGISTRATION_REJECTED, to_hex(device_id),
                    "Already exists");
        throw Failure(Nature::Structural, "Already exists");
    }

    Entry entry;
    entry.recipient = std::move(recipient);
    if (options_.expiry_delay != std::chrono::seconds::zero()) {
        entry.expires_at = options_.clock() + options_.expiry_delay;
    }

    backend_->store(options_.table_name, device_key(device_id), {EntryCodec::encode(entry)});
    MetricsRegistry::instance().increment(Counter::RegistrationStored);
    Logger::log(Logger::Level::INFO, Logger::Event::REGISTRATION_STORED, to_hex(device_id));
}

void RegistrationStore::close() {
    backend_->close();
}

}
