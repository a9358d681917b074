#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "errors.hpp"
#include "memory_backend.hpp"
#include "recipient.hpp"
#include "entry.hpp"

namespace devroute::testing {

// Manually advanced clock shared between a test and the store under test.
class FakeClock {
public:
    FakeClock() : now_(std::chrono::system_clock::time_point(std::chrono::seconds(1700000000))) {}

    TimePoint now() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(std::chrono::system_clock::duration d) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += d;
    }

    std::function<TimePoint()> fn() {
        return [this] { return now(); };
    }

private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

// Recipient whose serialized form is its payload; an empty payload fails.
class TestRecipient : public Recipient {
public:
    explicit TestRecipient(std::string payload) : payload_(std::move(payload)) {}

    std::string marshal_binary() const override {
        if (payload_.empty()) {
            throw Failure(Nature::Structural, "Fake error");
        }
        return payload_;
    }

private:
    std::string payload_;
};

class TestRegistration : public Registration {
public:
    TestRegistration(DeviceId id, std::string payload) : id_(id), recipient_(std::move(payload)) {}

    DeviceId device_id() const override { return id_; }
    const Recipient& recipient() const override { return recipient_; }

private:
    DeviceId id_;
    TestRecipient recipient_;
};

// MemoryBackend with call counters and switchable failures.
class ScriptedBackend : public MemoryBackend {
public:
    std::vector<std::string> lookup(const std::string& table, const std::string& key) override {
        lookups++;
        if (fail_lookup) throw Failure(Nature::Operational, "lookup failed");
        return MemoryBackend::lookup(table, key);
    }

    void store(const std::string& table, const std::string& key,
               const std::vector<std::string>& records) override {
        stores++;
        if (fail_store) throw Failure(Nature::Operational, "store failed");
        MemoryBackend::store(table, key, records);
    }

    void flush(const std::string& table, const std::string& key) override {
        flushes++;
        if (fail_flush) throw Failure(Nature::Operational, "flush failed");
        MemoryBackend::flush(table, key);
    }

    std::atomic<int> lookups{0};
    std::atomic<int> stores{0};
    std::atomic<int> flushes{0};
    std::atomic<bool> fail_lookup{false};
    std::atomic<bool> fail_store{false};
    std::atomic<bool> fail_flush{false};
};

inline DeviceId make_device(uint8_t last) {
    return DeviceId{0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, last};
}

}
