#pragma once

#include "nvrpc/runtime/value.hpp"

#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace nvrpc::runtime
{

enum class ErrorCode {
    Ok,
    ConnectionError,
    ProtocolError,
    EncodingError,
    RemoteError,
    HandlerError,
    DuplicateHandler,
    Timeout,
    Cancelled,
    InternalError,
};

class NvrpcErrorCategory : public std::error_category
{
public:
    const char* name() const noexcept override
    {
        return "nvrpc";
    }

    std::string message(int ev) const override
    {
        const auto code = static_cast<ErrorCode>(ev);
        switch (code) {
            case ErrorCode::Ok:
                return "ok";
            case ErrorCode::ConnectionError:
                return "connection error";
            case ErrorCode::ProtocolError:
                return "protocol error";
            case ErrorCode::EncodingError:
                return "encoding error";
            case ErrorCode::RemoteError:
                return "remote error";
            case ErrorCode::HandlerError:
                return "handler error";
            case ErrorCode::DuplicateHandler:
                return "duplicate handler";
            case ErrorCode::Timeout:
                return "timeout";
            case ErrorCode::Cancelled:
                return "cancelled";
            case ErrorCode::InternalError:
                return "internal error";
        }
        return "unknown";
    }
};

inline const std::error_category& nvrpc_error_category()
{
    static NvrpcErrorCategory category;
    return category;
}

inline std::error_code make_error_code(ErrorCode code)
{
    return {static_cast<int>(code), nvrpc_error_category()};
}

struct Error {
    std::error_code code = make_error_code(ErrorCode::InternalError);
    std::string message;
    /// Error object sent by the peer, set for ErrorCode::RemoteError only.
    std::optional<Value> payload;

    Error() = default;

    Error(ErrorCode code_, std::string message_)
        : code(make_error_code(code_))
        , message(std::move(message_))
    {
    }

    Error(std::error_code code_, std::string message_)
        : code(std::move(code_))
        , message(std::move(message_))
    {
    }

    bool is(ErrorCode other) const
    {
        return code == make_error_code(other);
    }
};

inline Error make_error(ErrorCode code, std::string message = {})
{
    return Error{code, std::move(message)};
}

inline Error make_error(std::error_code code, std::string message = {})
{
    return Error{std::move(code), std::move(message)};
}

inline Error remote_error(Value payload)
{
    Error error{ErrorCode::RemoteError, to_string(payload)};
    error.payload = std::move(payload);
    return error;
}

inline Error connection_closed_error(std::string reason = "connection closed")
{
    return make_error(ErrorCode::ConnectionError, std::move(reason));
}

}  // namespace nvrpc::runtime
