#include "router.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "metrics.hpp"

namespace devroute {

Router::Router(RegistrationStore& store)
    : store_(store)
{}

// Accepts a registration from a transport adapter. Rejections are counted,
// logged and rethrown.
void Router::register_device(const Registration& registration) {
    try {
        store_.store(registration);
    } catch (const Failure& e) {
        MetricsRegistry::instance().increment(Counter::RegistrationRejected);
        Logger::Level level = e.is(Nature::Operational) ? Logger::Level::ERROR : Logger::Level::WARNING;
        Logger::log(level, Logger::Event::REGISTRATION_REJECTED, to_hex(registration.device_id()),
                    std::string(nature_to_string(e.nature())) + ": " + e.what());
        throw;
    }
}

// Resolves a device to its HTTP recipient, folding NotFound into an empty result.
std::optional<HttpRecipient> Router::resolve(const DeviceId& device_id) {
    Entry entry;
    try {
        entry = store_.lookup(device_id);
    } catch (const Failure& e) {
        if (e.is(Nature::NotFound)) return std::nullopt;
        throw;
    }
    return HttpRecipient::unmarshal_binary(entry.recipient);
}

Router::RouteDecision Router::route(const DeviceId& device_id, const std::string& payload) {
    RouteDecision decision;
    if (payload.empty()) {
        decision.reason = "empty payload";
    } else if (auto recipient = resolve(device_id)) {
        decision.forward = true;
        decision.recipient = std::move(*recipient);
        MetricsRegistry::instance().increment(Counter::PacketsRouted);
        return decision;
    } else {
        decision.reason = "unknown device";
    }

    MetricsRegistry::instance().increment(Counter::PacketsDropped);
    Logger::log(Logger::Level::DEBUG, Logger::Event::PACKET_DROPPED, to_hex(device_id), decision.reason);
    return decision;
}

}
