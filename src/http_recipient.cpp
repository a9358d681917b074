#include "http_recipient.hpp"
#include "errors.hpp"
#include "input_validator.hpp"
#include <boost/json.hpp>

namespace json = boost::json;

namespace devroute {

namespace {

void validate(const std::string& url, const std::string& method) {
    if (url.empty()) {
        throw Failure(Nature::Structural, "HTTP recipient has no url");
    }
    if (!InputValidator::is_within_size_limit(url.size(), HttpRecipient::MAX_URL_LENGTH)) {
        throw Failure(Nature::Structural, "HTTP recipient url too long");
    }
    if (!InputValidator::is_valid_http_method(method)) {
        throw Failure(Nature::Structural, "HTTP recipient has invalid method '" + method + "'");
    }
}

}

std::string HttpRecipient::marshal_binary() const {
    validate(url_, method_);
    json::object obj;
    obj["url"] = url_;
    obj["method"] = method_;
    return json::serialize(obj);
}

HttpRecipient HttpRecipient::unmarshal_binary(const std::string& data) {
    json::value value;
    try {
        value = InputValidator::safe_parse_json(data);
    } catch (const std::exception& e) {
        throw Failure(Nature::Structural, "Malformed HTTP recipient: " + std::string(e.what()));
    }
    if (!value.is_object()) {
        throw Failure(Nature::Structural, "Malformed HTTP recipient: not an object");
    }
    const auto& obj = value.as_object();
    auto url = obj.if_contains("url");
    auto method = obj.if_contains("method");
    if (!url || !url->is_string() || !method || !method->is_string()) {
        throw Failure(Nature::Structural, "Malformed HTTP recipient: missing url or method");
    }
    HttpRecipient recipient(std::string(url->as_string()), std::string(method->as_string()));
    validate(recipient.url_, recipient.method_);
    return recipient;
}

}
