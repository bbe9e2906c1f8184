#pragma once

#include "nvrpc/runtime/message.hpp"
#include "nvrpc/runtime/result.hpp"
#include "nvrpc/runtime/value.hpp"

#include <msgpack.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace nvrpc::runtime
{

/**
 * @brief Table of msgpack ext type codes the peer announced during the handshake.
 *
 * Filled once by the client while the receive loop may already be decoding, hence the
 * internal lock.
 */
class ExtTypeRegistry
{
public:
    /// Re-registering the same (kind, code) pair is a no-op; any other clash fails.
    Result<void> register_type(std::string kind, std::int8_t code);

    std::optional<std::string> kind_of(std::int8_t code) const;
    std::optional<std::int8_t> code_of(std::string_view kind) const;
    bool contains(std::int8_t code) const;
    std::size_t size() const;

    /// Builds an ext value of a registered kind.
    Result<ExtValue> make(std::string_view kind, Binary data) const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::int8_t, std::string> kinds_;
};

class Encoder
{
public:
    explicit Encoder(std::shared_ptr<const ExtTypeRegistry> registry);

    Result<std::vector<std::uint8_t>> encode(const Frame& frame) const;

private:
    std::shared_ptr<const ExtTypeRegistry> registry_;
};

/**
 * @brief Streaming msgpack-RPC decoder.
 *
 * Bytes are fed in arbitrary chunks; `next()` yields complete frames and keeps any
 * trailing partial message buffered for the following `feed()`.
 */
class Decoder
{
public:
    explicit Decoder(std::shared_ptr<const ExtTypeRegistry> registry);

    Decoder(const Decoder&) = delete;
    Decoder& operator=(const Decoder&) = delete;

    void feed(std::span<const std::uint8_t> data);

    // Returns an empty optional when more bytes are needed.
    Result<std::optional<Frame>> next();

    std::size_t buffered() const;

private:
    std::shared_ptr<const ExtTypeRegistry> registry_;
    msgpack::unpacker unpacker_;
};

}  // namespace nvrpc::runtime
