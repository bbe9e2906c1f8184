#pragma once

#include "nvrpc/runtime/result.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

namespace nvrpc::runtime
{

/**
 * @brief Duplex byte stream to the peer.
 *
 * `read_some` and `write` may be called concurrently from one reader and one writer.
 * `close` is idempotent and wakes a blocked reader, which then fails with
 * ErrorCode::Cancelled.
 */
class Connection
{
public:
    virtual ~Connection() = default;

    virtual Result<void> write(std::span<const std::uint8_t> data) = 0;

    // Returns 0 once the peer has closed the stream.
    virtual Result<std::size_t> read_some(std::span<std::uint8_t> buffer) = 0;

    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

}  // namespace nvrpc::runtime
