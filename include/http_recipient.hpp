#pragma once

#include <string>
#include <utility>
#include "recipient.hpp"

namespace devroute {

// Recipient reached through the HTTP adapter: an endpoint and the method to
// call it with. Serialized as {"url":...,"method":...}.
class HttpRecipient : public Recipient {
public:
    static constexpr size_t MAX_URL_LENGTH = 2048;

    HttpRecipient() = default;
    HttpRecipient(std::string url, std::string method)
        : url_(std::move(url)), method_(std::move(method)) {}

    const std::string& url() const { return url_; }
    const std::string& method() const { return method_; }

    std::string marshal_binary() const override;

    // Throws Failure(Structural) on malformed or incomplete input.
    static HttpRecipient unmarshal_binary(const std::string& data);

    bool operator==(const HttpRecipient& other) const {
        return url_ == other.url_ && method_ == other.method_;
    }

private:
    std::string url_;
    std::string method_;
};

class HttpRegistration : public Registration {
public:
    HttpRegistration(DeviceId device_id, HttpRecipient recipient)
        : device_id_(device_id), recipient_(std::move(recipient)) {}

    DeviceId device_id() const override { return device_id_; }
    const Recipient& recipient() const override { return recipient_; }

    const HttpRecipient& http_recipient() const { return recipient_; }

private:
    DeviceId device_id_;
    HttpRecipient recipient_;
};

}
