#pragma once

#include <string>
#include <memory>
#include <vector>
#include <shared_mutex>
#include <sw/redis++/redis++.h>
#include "key_value_backend.hpp"

namespace devroute {

struct RouterConfig;

// Redis-backed registration storage.
// Each table/key pair maps to a Redis list "<table>:<hex key>" holding the
// encoded records, so several router nodes can share one registration table.
class RedisBackend : public KeyValueBackend {
public:
    // Connects and pings the server. Throws Failure(Operational) when unreachable.
    explicit RedisBackend(const RouterConfig& config);
    ~RedisBackend() override;

    RedisBackend(const RedisBackend&) = delete;
    RedisBackend& operator=(const RedisBackend&) = delete;

    std::vector<std::string> lookup(const std::string& table, const std::string& key) override;
    void store(const std::string& table, const std::string& key,
               const std::vector<std::string>& records) override;
    void flush(const std::string& table, const std::string& key) override;
    void close() override;

    // Redis key a table/key pair is stored under.
    static std::string redis_key(const std::string& table, const std::string& key);

private:
    std::unique_ptr<sw::redis::Redis> redis_;
    mutable std::shared_mutex mutex_; // Guards redis_ against a concurrent close()
};

}
