#include "redis_backend.hpp"
#include "router_config.hpp"
#include "device_id.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "metrics.hpp"
#include <chrono>
#include <iterator>
#include <mutex>

namespace devroute {

namespace {

Failure backend_failure(const std::string& op, const sw::redis::Error& e) {
    MetricsRegistry::instance().increment(Counter::BackendFailure);
    Logger::log(Logger::Level::ERROR, Logger::Event::BACKEND_FAILURE, "", "Redis " + op + " failed: " + e.what());
    return Failure(Nature::Operational, "Redis " + op + " failed: " + std::string(e.what()));
}

}

RedisBackend::RedisBackend(const RouterConfig& config) {
    try {
        // Initialize the Redis client using the provided connection string.
        sw::redis::ConnectionOptions opts(config.backend_url);
        if (!config.redis_password.empty()) {
            opts.password = config.redis_password;
        }
        opts.connect_timeout = std::chrono::milliseconds(config.redis_connect_timeout_ms);
        redis_ = std::make_unique<sw::redis::Redis>(opts);
        redis_->ping();
        Logger::log(Logger::Level::INFO, Logger::Event::CONFIG, "", "Redis connected: " + config.backend_url);
    } catch (const sw::redis::Error& e) {
        throw backend_failure("connect", e);
    }
}

RedisBackend::~RedisBackend() = default;

std::string RedisBackend::redis_key(const std::string& table, const std::string& key) {
    return table + ":" + encode_hex(key);
}

std::vector<std::string> RedisBackend::lookup(const std::string& table, const std::string& key) {
    std::shared_lock lock(mutex_);
    if (!redis_) throw Failure(Nature::Operational, "Backend is closed");
    std::vector<std::string> records;
    try {
        redis_->lrange(redis_key(table, key), 0, -1, std::back_inserter(records));
    } catch (const sw::redis::Error& e) {
        throw backend_failure("lookup", e);
    }
    return records;
}

// Replaces the list in a single MULTI/EXEC so readers never observe a
// half-written key.
void RedisBackend::store(const std::string& table, const std::string& key,
                         const std::vector<std::string>& records) {
    std::shared_lock lock(mutex_);
    if (!redis_) throw Failure(Nature::Operational, "Backend is closed");
    std::string rkey = redis_key(table, key);
    try {
        auto tx = redis_->transaction();
        tx.del(rkey);
        if (!records.empty()) {
            tx.rpush(rkey, records.begin(), records.end());
        }
        tx.exec();
    } catch (const sw::redis::Error& e) {
        throw backend_failure("store", e);
    }
}

void RedisBackend::flush(const std::string& table, const std::string& key) {
    std::shared_lock lock(mutex_);
    if (!redis_) throw Failure(Nature::Operational, "Backend is closed");
    try {
        redis_->del(redis_key(table, key));
    } catch (const sw::redis::Error& e) {
        throw backend_failure("flush", e);
    }
}

void RedisBackend::close() {
    std::unique_lock lock(mutex_);
    redis_.reset();
}

}
