#pragma once

#include <optional>
#include <string>
#include "device_id.hpp"
#include "http_recipient.hpp"
#include "registration_store.hpp"

namespace devroute {

 
// Routing layer in front of the registration store.
// Resolves the recipient a device's traffic must be forwarded to and accepts
// new device registrations from the transport adapters.
class Router {
public:
    // Outcome of routing one uplink packet.
    struct RouteDecision {
        bool forward = false;
        HttpRecipient recipient;
        std::string reason;   // Set when the packet is dropped
    };

    explicit Router(RegistrationStore& store);
    ~Router() = default;

    /**
     * Persists a device registration.
     * Throws Failure(Structural) on duplicates or bad recipients. Every
     * rejection is logged and counted before it is rethrown.
     */
    void register_device(const Registration& registration);

    // Returns std::nullopt for unknown or expired devices; other failures propagate.
    std::optional<HttpRecipient> resolve(const DeviceId& device_id);

    // Decides where a packet for device_id goes. Unknown devices are dropped.
    RouteDecision route(const DeviceId& device_id, const std::string& payload);

private:
    RegistrationStore& store_;
};

}
