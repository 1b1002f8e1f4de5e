#pragma once

#include "relay/Connection.hpp"

#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace walkierelay::relay {

enum class ErrorCode { InvalidPayload, IdentityNotSet, UnknownEvent };

std::string_view to_string(ErrorCode code) noexcept;

// Rejection of one inbound event; the dispatcher turns it into an `error`
// reply to the sender.
class RelayError : public std::runtime_error {
public:
    RelayError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// Field accessors. Absent or null optional fields read as "not given"; a
// present field of the wrong type is always an InvalidPayload.
std::string require_string(const boost::json::object& data, std::string_view key);
std::optional<std::string> optional_string(const boost::json::object& data, std::string_view key);
const boost::json::value& require_field(const boost::json::object& data, std::string_view key);
const boost::json::value* optional_field(const boost::json::object& data, std::string_view key);

// Sender identity for channel operations: the registered identity wins, a
// payload `userId` is accepted from connections that never joined, anything
// else is IdentityNotSet.
std::string sender_identity(const Connection* sender, const boost::json::object& data);

// Client `timestamp` when given, otherwise `now_ms`.
boost::json::value timestamp_or(const boost::json::object& data, std::int64_t now_ms);

} // namespace walkierelay::relay
