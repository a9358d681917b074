#pragma once

#include <memory>
#include <string>
#include <vector>

namespace devroute {

struct RouterConfig;

 
// Abstract key-value collaborator the registration store is built on.
// Records are opaque byte strings; the store owns their encoding.
// Every failure is reported as Failure(Operational).
class KeyValueBackend {
public:
    virtual ~KeyValueBackend() = default;
    
    /**
     * Returns every record stored under a key.
     * @param table Namespace the key lives in.
     * @param key Raw key bytes.
     * @return Records in insertion order, empty if the key is unknown.
     */
    virtual std::vector<std::string> lookup(const std::string& table, const std::string& key) = 0;
    
    /**
     * Atomically replaces all records under a key.
     */
    virtual void store(const std::string& table, const std::string& key,
                       const std::vector<std::string>& records) = 0;

    // Removes all records under a key. Flushing an unknown key is not an error.
    virtual void flush(const std::string& table, const std::string& key) = 0;

    // Releases the backend. Closing twice is a no-op.
    virtual void close() = 0;
};

/**
 * Builds the backend named by config.backend_url.
 * Throws Failure(Operational) for unknown schemes or when the backend
 * cannot be reached.
 */
std::unique_ptr<KeyValueBackend> make_backend(const RouterConfig& config);

} 
