#pragma once

#include "nvrpc/runtime/api_info.hpp"
#include "nvrpc/runtime/capabilities.hpp"
#include "nvrpc/runtime/codec.hpp"
#include "nvrpc/runtime/connection.hpp"
#include "nvrpc/runtime/dispatcher.hpp"
#include "nvrpc/runtime/executor.hpp"
#include "nvrpc/runtime/exports.hpp"
#include "nvrpc/runtime/result.hpp"
#include "nvrpc/runtime/value.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nvrpc::runtime
{

enum class HandshakeState {
    Connecting,
    HandshakeClientInfo,
    HandshakeCapabilities,
    HandshakeExtTypes,
    Ready,
    Failed,
};

std::string_view to_string(HandshakeState state);

/// Identity announced through `nvim_set_client_info`.
struct ClientInfo {
    std::string name = "nvrpc";
    std::int64_t major = NVRPC_VERSION_MAJOR;
    std::int64_t minor = NVRPC_VERSION_MINOR;
    std::int64_t patch = NVRPC_VERSION_PATCH;
    std::string type = "remote";
    Value methods = Array{};
    Value attributes = Map{};
};

struct ClientConfig {
    ClientInfo info;
    /// Ext type names the peer must announce, or the handshake fails.
    std::vector<std::string> required_ext_types{"Buffer", "Window", "Tabpage"};
    /// Handler pool size; 0 picks the hardware concurrency. Ignored when `executor` is set.
    std::size_t worker_threads = 0;
    std::shared_ptr<Executor> executor;
    std::size_t read_chunk_size = 1'000'000;
    std::optional<std::chrono::milliseconds> handshake_timeout;
};

/**
 * @brief msgpack-RPC client bound to a single connection.
 *
 * Register handlers first, then `connect()`. The call returns once the handshake has
 * completed; requests and notifications the peer sent in the meantime are dispatched
 * after that, in arrival order.
 *
 * All methods are thread-safe. `request` blocks the calling thread until the response
 * arrives or the connection terminates; it must not be called from a handler when the
 * executor has a single worker and the peer needs that worker to answer.
 */
class Client
{
public:
    explicit Client(ClientConfig config = {});
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    Result<void> connect(const std::string& path);
    Result<void> attach(std::shared_ptr<Connection> connection);

    Result<void> notify(std::string method, Array params = {});
    Result<Value> request(std::string method, Array params = {});
    Result<Value> request(std::string method, Array params, std::chrono::milliseconds deadline);
    Result<std::future<Result<Value>>> request_async(std::string method, Array params = {});

    Result<void> on_notify(std::string method, NotifyHandler handler);
    Result<void> on_request(std::string method, RequestHandler handler);

    /// Registers the handler and installs Lua/VimL functions that call it on the peer.
    Result<RemoteExport> expose_request(std::string name, RequestHandler handler);
    Result<RemoteExport> expose_notify(std::string name, NotifyHandler handler);

    /// Throws std::logic_error before the handshake has completed.
    std::int64_t channel() const;
    const ApiInfo& api_info() const;

    HandshakeState state() const;
    const ExtTypeRegistry& ext_types() const;
    CapabilityCache& capabilities();

    /// Flushes queued frames and closes the connection. Idempotent; may be called from
    /// several threads at once and from inside a handler. The destructor additionally
    /// waits for handler runs still scheduled on the executor, so the client must not be
    /// destroyed from one of its own handlers.
    void close();
    /// Blocks until the connection has terminated, or returns at once if the client was
    /// closed without ever attaching.
    void wait();
    bool closed() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace nvrpc::runtime
