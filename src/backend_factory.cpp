#include "key_value_backend.hpp"
#include "memory_backend.hpp"
#include "redis_backend.hpp"
#include "router_config.hpp"
#include "errors.hpp"

namespace devroute {

std::unique_ptr<KeyValueBackend> make_backend(const RouterConfig& config) {
    const std::string& url = config.backend_url;
    if (url == "memory://") {
        return std::make_unique<MemoryBackend>();
    }
    if (url.rfind("tcp://", 0) == 0 || url.rfind("unix://", 0) == 0) {
        return std::make_unique<RedisBackend>(config);
    }
    throw Failure(Nature::Operational, "Unsupported backend URL: " + url);
}

}
