#pragma once

#include "nvrpc/runtime/error.hpp"

#include <expected>
#include <string>
#include <utility>

namespace nvrpc::runtime
{

template <typename T>
using Result = std::expected<T, Error>;

template <typename T = void>
inline Result<T> unexpected_result(Error error)
{
    return std::unexpected(std::move(error));
}

template <typename T = void>
inline Result<T> unexpected_result(ErrorCode code, std::string message = {})
{
    return unexpected_result<T>(make_error(code, std::move(message)));
}

template <typename T = void>
inline Result<T> protocol_error(std::string message)
{
    return unexpected_result<T>(ErrorCode::ProtocolError, std::move(message));
}

template <typename T = void>
inline Result<T> encoding_error(std::string message)
{
    return unexpected_result<T>(ErrorCode::EncodingError, std::move(message));
}

}  // namespace nvrpc::runtime
