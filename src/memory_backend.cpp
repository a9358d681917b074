#include "memory_backend.hpp"
#include "errors.hpp"
#include <mutex>

namespace devroute {

void MemoryBackend::ensure_open() const {
    if (closed_) {
        throw Failure(Nature::Operational, "Backend is closed");
    }
}

std::vector<std::string> MemoryBackend::lookup(const std::string& table, const std::string& key) {
    std::shared_lock lock(mutex_);
    ensure_open();
    auto t = tables_.find(table);
    if (t == tables_.end()) return {};
    auto it = t->second.find(key);
    if (it == t->second.end()) return {};
    return it->second;
}

void MemoryBackend::store(const std::string& table, const std::string& key,
                          const std::vector<std::string>& records) {
    std::unique_lock lock(mutex_);
    ensure_open();
    if (records.empty()) {
        tables_[table].erase(key);
        return;
    }
    tables_[table][key] = records;
}

void MemoryBackend::flush(const std::string& table, const std::string& key) {
    std::unique_lock lock(mutex_);
    ensure_open();
    auto t = tables_.find(table);
    if (t != tables_.end()) {
        t->second.erase(key);
    }
}

void MemoryBackend::close() {
    std::unique_lock lock(mutex_);
    if (closed_) return;
    tables_.clear();
    closed_ = true;
}

bool MemoryBackend::is_closed() const {
    std::shared_lock lock(mutex_);
    return closed_;
}

size_t MemoryBackend::key_count(const std::string& table) const {
    std::shared_lock lock(mutex_);
    auto t = tables_.find(table);
    return t == tables_.end() ? 0 : t->second.size();
}

}
