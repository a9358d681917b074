#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include <shared_mutex>
#include "key_value_backend.hpp"

namespace devroute {

// In-process backend. Used for single-node deployments and tests.
class MemoryBackend : public KeyValueBackend {
public:
    MemoryBackend() = default;
    ~MemoryBackend() override = default;

    MemoryBackend(const MemoryBackend&) = delete;
    MemoryBackend& operator=(const MemoryBackend&) = delete;

    std::vector<std::string> lookup(const std::string& table, const std::string& key) override;
    void store(const std::string& table, const std::string& key,
               const std::vector<std::string>& records) override;
    void flush(const std::string& table, const std::string& key) override;
    void close() override;

    bool is_closed() const;

    // Number of keys currently held in a table.
    size_t key_count(const std::string& table) const;

private:
    using Table = std::unordered_map<std::string, std::vector<std::string>>;

    void ensure_open() const;

    std::unordered_map<std::string, Table> tables_;
    bool closed_ = false;
    mutable std::shared_mutex mutex_;
};

}
