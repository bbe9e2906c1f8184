#pragma once

#include "nvrpc/runtime/value.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace nvrpc::runtime
{

enum class MessageType : std::uint8_t {
    Request = 0,
    Response = 1,
    Notification = 2,
};

inline std::string_view to_string(MessageType type)
{
    switch (type) {
        case MessageType::Request:
            return "REQUEST";
        case MessageType::Response:
            return "RESPONSE";
        case MessageType::Notification:
            return "NOTIFICATION";
    }
    return "UNKNOWN";
}

/// `[0, id, method, params]`
struct Request {
    std::uint64_t id = 0;
    std::string method;
    Array params;

    bool operator==(const Request&) const = default;
};

/// `[1, id, error, result]`. A nil error means success.
struct Response {
    std::uint64_t id = 0;
    Value error;
    Value result;

    bool operator==(const Response&) const = default;
};

/// `[2, method, params]`
struct Notification {
    std::string method;
    Array params;

    bool operator==(const Notification&) const = default;
};

using Frame = std::variant<Request, Response, Notification>;

inline MessageType type_of(const Frame& frame)
{
    return static_cast<MessageType>(frame.index());
}

}  // namespace nvrpc::runtime
