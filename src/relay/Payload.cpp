#include "relay/Payload.h"

namespace walkierelay::relay {

namespace json = boost::json;

std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidPayload: return "invalid-payload";
        case ErrorCode::IdentityNotSet: return "identity-not-set";
        case ErrorCode::UnknownEvent:   return "unknown-event";
    }
    return "error";
}

const json::value* optional_field(const json::object& data, std::string_view key) {
    const json::value* v = data.if_contains(json::string_view(key.data(), key.size()));
    if (!v || v->is_null()) return nullptr;
    return v;
}

const json::value& require_field(const json::object& data, std::string_view key) {
    const json::value* v = optional_field(data, key);
    if (!v) {
        throw RelayError(ErrorCode::InvalidPayload, "missing " + std::string(key));
    }
    return *v;
}

std::optional<std::string> optional_string(const json::object& data, std::string_view key) {
    const json::value* v = optional_field(data, key);
    if (!v) return std::nullopt;
    const json::string* s = v->if_string();
    if (!s) {
        throw RelayError(ErrorCode::InvalidPayload, std::string(key) + " must be a string");
    }
    return std::string(s->data(), s->size());
}

std::string require_string(const json::object& data, std::string_view key) {
    auto s = optional_string(data, key);
    if (!s) {
        throw RelayError(ErrorCode::InvalidPayload, "missing " + std::string(key));
    }
    return *s;
}

std::string sender_identity(const Connection* sender, const json::object& data) {
    if (sender && sender->user_id) return *sender->user_id;
    if (auto claimed = optional_string(data, "userId")) return *claimed;
    throw RelayError(ErrorCode::IdentityNotSet, "join a channel or supply userId first");
}

json::value timestamp_or(const json::object& data, std::int64_t now_ms) {
    if (const json::value* ts = optional_field(data, "timestamp")) return *ts;
    return json::value(now_ms);
}

} // namespace walkierelay::relay
