#pragma once

#include <string>
#include "device_id.hpp"

namespace devroute {

// Transport-specific forwarding destination. The store never interprets
// the serialized form.
class Recipient {
public:
    virtual ~Recipient() = default;

    /**
     * Deterministic binary serialization.
     * Throws Failure(Structural) when the descriptor cannot be serialized.
     */
    virtual std::string marshal_binary() const = 0;
};

// Input to RegistrationStore::store: a device paired with its recipient.
class Registration {
public:
    virtual ~Registration() = default;

    virtual DeviceId device_id() const = 0;
    virtual const Recipient& recipient() const = 0;
};

}
