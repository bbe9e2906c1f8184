#include "nvrpc/runtime/client.hpp"

#include "nvrpc/runtime/correlator.hpp"
#include "nvrpc/runtime/transport.hpp"
#include "nvrpc/runtime/uds.hpp"

#include <spdlog/spdlog.h>
#include <fmt/core.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

namespace nvrpc::runtime
{

std::string_view to_string(HandshakeState state)
{
    switch (state) {
        case HandshakeState::Connecting:
            return "Connecting";
        case HandshakeState::HandshakeClientInfo:
            return "HandshakeClientInfo";
        case HandshakeState::HandshakeCapabilities:
            return "HandshakeCapabilities";
        case HandshakeState::HandshakeExtTypes:
            return "HandshakeExtTypes";
        case HandshakeState::Ready:
            return "Ready";
        case HandshakeState::Failed:
            return "Failed";
    }
    return "Unknown";
}

class Client::Impl
{
public:
    explicit Impl(ClientConfig config)
        : config_(std::move(config))
        , registry_(std::make_shared<ExtTypeRegistry>())
        , encoder_(registry_)
        , correlator_([this](const Frame& frame) { return send_frame(frame); })
        , capabilities_([this](std::string method, Array params) { return request(std::move(method), std::move(params)); })
    {
        executor_ = config_.executor;
        if (!executor_) {
            auto threads = config_.worker_threads;
            if (threads == 0) {
                threads = std::max<std::size_t>(1, std::thread::hardware_concurrency());
            }
            owned_pool_ = std::make_shared<ThreadPoolExecutor>(threads);
            executor_ = owned_pool_;
        }
        dispatcher_ = std::make_unique<Dispatcher>(executor_, [this](const Frame& frame) { return send_frame(frame); });
        dispatcher_->hold();
    }

    ~Impl()
    {
        close();
        // Handler runs still queued on a shared executor refer to this client.
        dispatcher_->shutdown();
        if (owned_pool_) {
            owned_pool_->stop();
        }
    }

    Result<void> connect(const std::string& path)
    {
        state_.store(HandshakeState::Connecting, std::memory_order_release);
        auto connection = uds::connect(path);
        if (!connection) {
            state_.store(HandshakeState::Failed, std::memory_order_release);
            spdlog::error("client: cannot connect to {}: {}", path, connection.error().message);
            return std::unexpected(connection.error());
        }
        return attach(std::move(*connection));
    }

    Result<void> attach(std::shared_ptr<Connection> connection)
    {
        if (attached_.exchange(true, std::memory_order_acq_rel)) {
            return unexpected_result(ErrorCode::InternalError, "client is already attached to a connection");
        }

        state_.store(HandshakeState::Connecting, std::memory_order_release);
        auto transport = std::make_unique<Transport>(
            std::move(connection),
            registry_,
            [this](Frame&& frame) { route(std::move(frame)); },
            [this](const Error& reason) { handle_close(reason); },
            TransportConfig{config_.read_chunk_size});
        {
            std::lock_guard lock(close_mutex_);
            if (closed_) {
                state_.store(HandshakeState::Failed, std::memory_order_release);
                return unexpected_result(connection_closed_error("client was closed before attaching"));
            }
            transport->start();
            transport_ = std::move(transport);
        }
        ready_to_send_.store(true, std::memory_order_release);

        return handshake();
    }

    Result<void> notify(std::string method, Array params)
    {
        spdlog::debug("client: notify {}", method);
        return send_frame(Notification{std::move(method), std::move(params)});
    }

    Result<Value> request(std::string method, Array params)
    {
        auto call = correlator_.submit(std::move(method), std::move(params));
        if (!call) {
            return std::unexpected(call.error());
        }
        return call->future.get();
    }

    Result<Value> request(std::string method, Array params, std::chrono::milliseconds deadline)
    {
        auto call = correlator_.submit(method, std::move(params));
        if (!call) {
            return std::unexpected(call.error());
        }
        if (call->future.wait_for(deadline) == std::future_status::timeout) {
            // A concurrent resolve wins if it got there first.
            correlator_.cancel(call->id,
                               make_error(ErrorCode::Timeout,
                                          fmt::format("no response to '{}' within {}ms", method, deadline.count())));
        }
        return call->future.get();
    }

    Result<std::future<Result<Value>>> request_async(std::string method, Array params)
    {
        auto call = correlator_.submit(std::move(method), std::move(params));
        if (!call) {
            return std::unexpected(call.error());
        }
        return std::move(call->future);
    }

    Result<RemoteExport> expose(RemoteExport exported)
    {
        auto lua = request("nvim_exec_lua", Array{Value{lua_binding(channel(), exported)}, Value{Array{}}});
        if (!lua) {
            return std::unexpected(lua.error());
        }
        auto viml = request("nvim_exec", Array{Value{viml_binding(exported)}, Value{false}});
        if (!viml) {
            return std::unexpected(viml.error());
        }
        spdlog::info("client: exposed {} as {}", exported.name, exported.remote_name);
        return exported;
    }

    std::int64_t channel() const
    {
        return api_info().channel_id;
    }

    const ApiInfo& api_info() const
    {
        if (state_.load(std::memory_order_acquire) != HandshakeState::Ready) {
            throw std::logic_error("channel id is not available before the handshake completes");
        }
        return *api_info_;
    }

    // Callable concurrently and from handlers. The transport is never reset before the
    // destructor, so the pointer taken under the lock stays valid.
    void close()
    {
        Transport* transport = nullptr;
        {
            std::lock_guard lock(close_mutex_);
            transport = transport_.get();
            if (!transport) {
                closed_ = true;
            }
        }
        if (transport) {
            transport->close();
            transport->join();
        } else {
            close_cv_.notify_all();
        }
        correlator_.reject_all(connection_closed_error());
    }

    void wait()
    {
        std::unique_lock lock(close_mutex_);
        close_cv_.wait(lock, [this] { return closed_; });
    }

    bool closed() const
    {
        std::lock_guard lock(close_mutex_);
        return closed_;
    }

    ClientConfig config_;
    std::shared_ptr<ExtTypeRegistry> registry_;
    Encoder encoder_;
    std::shared_ptr<Executor> executor_;
    std::shared_ptr<ThreadPoolExecutor> owned_pool_;
    Correlator correlator_;
    std::unique_ptr<Dispatcher> dispatcher_;
    CapabilityCache capabilities_;
    std::atomic<HandshakeState> state_{HandshakeState::Connecting};

private:
    Result<void> send_frame(const Frame& frame)
    {
        if (!ready_to_send_.load(std::memory_order_acquire)) {
            return unexpected_result(ErrorCode::ConnectionError, "client is not connected");
        }
        auto bytes = encoder_.encode(frame);
        if (!bytes) {
            return std::unexpected(bytes.error());
        }
        return transport_->send(std::move(*bytes));
    }

    void route(Frame&& frame)
    {
        if (auto* response = std::get_if<Response>(&frame)) {
            correlator_.resolve(std::move(*response));
            return;
        }
        dispatcher_->handle(std::move(frame));
    }

    void handle_close(const Error& reason)
    {
        if (reason.is(ErrorCode::ProtocolError)) {
            correlator_.reject_all(reason);
        } else {
            correlator_.reject_all(connection_closed_error(
                reason.is(ErrorCode::Cancelled) ? std::string("connection closed") : reason.message));
        }
        {
            std::lock_guard lock(close_mutex_);
            closed_ = true;
        }
        close_cv_.notify_all();
    }

    Result<void> handshake()
    {
        state_.store(HandshakeState::HandshakeClientInfo, std::memory_order_release);
        const auto& info = config_.info;
        Map version{
            {Value{"major"}, Value{info.major}},
            {Value{"minor"}, Value{info.minor}},
            {Value{"patch"}, Value{info.patch}},
        };
        if (auto res = notify("nvim_set_client_info",
                              Array{Value{info.name}, Value{std::move(version)}, Value{info.type}, info.methods,
                                    info.attributes});
            !res) {
            return fail(res.error());
        }

        state_.store(HandshakeState::HandshakeCapabilities, std::memory_order_release);
        auto reply = config_.handshake_timeout ? request("nvim_get_api_info", {}, *config_.handshake_timeout)
                                               : request("nvim_get_api_info", {});
        if (!reply) {
            return fail(reply.error());
        }
        auto parsed = parse_api_info(*reply);
        if (!parsed) {
            return fail(parsed.error());
        }
        for (const auto& required : config_.required_ext_types) {
            if (!parsed->ext_types.contains(required)) {
                return fail(make_error(ErrorCode::ProtocolError,
                                       fmt::format("api metadata does not describe ext type {}", required)));
            }
        }

        state_.store(HandshakeState::HandshakeExtTypes, std::memory_order_release);
        for (const auto& [name, code] : parsed->ext_types) {
            if (auto res = registry_->register_type(name, code); !res) {
                return fail(res.error());
            }
        }

        api_info_ = std::move(*parsed);
        state_.store(HandshakeState::Ready, std::memory_order_release);
        spdlog::info("client: ready on channel {} ({} ext types)", api_info_->channel_id, api_info_->ext_types.size());
        dispatcher_->release();
        return {};
    }

    Result<void> fail(Error error)
    {
        spdlog::error("client: handshake failed in state {}: {}",
                      to_string(state_.load(std::memory_order_acquire)),
                      error.message);
        state_.store(HandshakeState::Failed, std::memory_order_release);
        close();
        return unexpected_result(std::move(error));
    }

    std::unique_ptr<Transport> transport_;
    std::atomic<bool> attached_{false};
    std::atomic<bool> ready_to_send_{false};
    std::optional<ApiInfo> api_info_;

    mutable std::mutex close_mutex_;
    std::condition_variable close_cv_;
    bool closed_ = false;
};

Client::Client(ClientConfig config)
    : impl_(std::make_unique<Impl>(std::move(config)))
{
}

Client::~Client() = default;

Result<void> Client::connect(const std::string& path)
{
    return impl_->connect(path);
}

Result<void> Client::attach(std::shared_ptr<Connection> connection)
{
    return impl_->attach(std::move(connection));
}

Result<void> Client::notify(std::string method, Array params)
{
    return impl_->notify(std::move(method), std::move(params));
}

Result<Value> Client::request(std::string method, Array params)
{
    return impl_->request(std::move(method), std::move(params));
}

Result<Value> Client::request(std::string method, Array params, std::chrono::milliseconds deadline)
{
    return impl_->request(std::move(method), std::move(params), deadline);
}

Result<std::future<Result<Value>>> Client::request_async(std::string method, Array params)
{
    return impl_->request_async(std::move(method), std::move(params));
}

Result<void> Client::on_notify(std::string method, NotifyHandler handler)
{
    return impl_->dispatcher_->on_notify(std::move(method), std::move(handler));
}

Result<void> Client::on_request(std::string method, RequestHandler handler)
{
    return impl_->dispatcher_->on_request(std::move(method), std::move(handler));
}

Result<RemoteExport> Client::expose_request(std::string name, RequestHandler handler)
{
    if (state() != HandshakeState::Ready) {
        return unexpected_result<RemoteExport>(ErrorCode::ConnectionError, "client is not ready");
    }
    if (auto res = on_request(name, std::move(handler)); !res) {
        return std::unexpected(res.error());
    }
    return impl_->expose(make_export(std::move(name), true));
}

Result<RemoteExport> Client::expose_notify(std::string name, NotifyHandler handler)
{
    if (state() != HandshakeState::Ready) {
        return unexpected_result<RemoteExport>(ErrorCode::ConnectionError, "client is not ready");
    }
    if (auto res = on_notify(name, std::move(handler)); !res) {
        return std::unexpected(res.error());
    }
    return impl_->expose(make_export(std::move(name), false));
}

std::int64_t Client::channel() const
{
    return impl_->channel();
}

const ApiInfo& Client::api_info() const
{
    return impl_->api_info();
}

HandshakeState Client::state() const
{
    return impl_->state_.load(std::memory_order_acquire);
}

const ExtTypeRegistry& Client::ext_types() const
{
    return *impl_->registry_;
}

CapabilityCache& Client::capabilities()
{
    return impl_->capabilities_;
}

void Client::close()
{
    impl_->close();
}

void Client::wait()
{
    impl_->wait();
}

bool Client::closed() const
{
    return impl_->closed();
}

}  // namespace nvrpc::runtime
