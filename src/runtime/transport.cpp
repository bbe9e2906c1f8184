#include "nvrpc/runtime/transport.hpp"

#include <spdlog/spdlog.h>

#include <span>
#include <utility>

namespace nvrpc::runtime
{
namespace
{

// Loop thread the caller runs on, if any. A loop cannot join itself.
thread_local const std::thread* current_loop = nullptr;

}  // namespace

Transport::Transport(std::shared_ptr<Connection> connection,
                     std::shared_ptr<const ExtTypeRegistry> registry,
                     FrameCallback on_frame,
                     CloseCallback on_close,
                     TransportConfig config)
    : connection_(std::move(connection))
    , decoder_(std::move(registry))
    , on_frame_(std::move(on_frame))
    , on_close_(std::move(on_close))
    , config_(config)
{
    if (config_.read_chunk_size == 0) {
        config_.read_chunk_size = TransportConfig{}.read_chunk_size;
    }
}

Transport::~Transport()
{
    close();
    join();
    for (auto* loop : {&send_thread_, &receive_thread_}) {
        // Only reachable when a loop destroys its own transport from a callback.
        if (current_loop == loop && loop->joinable()) {
            spdlog::warn("transport: destroyed from its own loop thread");
            loop->detach();
        }
    }
}

void Transport::start()
{
    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return;
    }
    send_thread_ = std::thread([this] { send_loop(); });
    receive_thread_ = std::thread([this] { receive_loop(); });
}

Result<void> Transport::send(std::vector<std::uint8_t> chunk)
{
    return enqueue(std::move(chunk));
}

Result<void> Transport::flush()
{
    return enqueue(std::nullopt);
}

Result<void> Transport::enqueue(std::optional<std::vector<std::uint8_t>> item)
{
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return unexpected_result(connection_closed_error());
        }
        queue_.push_back(std::move(item));
    }
    cv_.notify_one();
    return {};
}

void Transport::close()
{
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();
    if (!started_.load(std::memory_order_acquire)) {
        connection_->close();
        finished_.store(true, std::memory_order_release);
    }
}

void Transport::join()
{
    if (!started_.load(std::memory_order_acquire)) {
        return;
    }
    join_loop(send_joined_, send_thread_);
    join_loop(receive_joined_, receive_thread_);
}

void Transport::join_loop(std::once_flag& joined, std::thread& loop)
{
    if (current_loop == &loop) {
        return;
    }
    // Concurrent callers block until the first one has joined.
    std::call_once(joined, [&loop] {
        if (loop.joinable()) {
            loop.join();
        }
    });
}

void Transport::send_loop()
{
    current_loop = &send_thread_;
    std::vector<std::uint8_t> pending;
    while (true) {
        std::optional<std::vector<std::uint8_t>> item;
        bool drained = false;
        bool stopping = false;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                stopping = true;
            } else {
                item = std::move(queue_.front());
                queue_.pop_front();
                drained = queue_.empty();
            }
        }

        if (item) {
            pending.insert(pending.end(), item->begin(), item->end());
        }
        if (!pending.empty() && (stopping || !item || drained)) {
            if (auto res = connection_->write(pending); !res) {
                finish(res.error());
                return;
            }
            spdlog::trace("transport: wrote {} bytes", pending.size());
            pending.clear();
        }
        if (stopping) {
            break;
        }
    }
    // Wakes the receive loop, which reports the termination.
    connection_->close();
}

void Transport::receive_loop()
{
    current_loop = &receive_thread_;
    std::vector<std::uint8_t> buffer(config_.read_chunk_size);
    while (true) {
        auto read = connection_->read_some(buffer);
        if (!read) {
            finish(read.error());
            return;
        }
        if (*read == 0) {
            finish(connection_closed_error("peer closed connection"));
            return;
        }

        decoder_.feed(std::span<const std::uint8_t>(buffer.data(), *read));
        while (true) {
            auto frame = decoder_.next();
            if (!frame) {
                spdlog::error("transport: {}", frame.error().message);
                finish(frame.error());
                return;
            }
            if (!*frame) {
                break;
            }
            on_frame_(std::move(**frame));
        }
    }
}

void Transport::finish(const Error& reason)
{
    if (finished_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
        queue_.clear();
    }
    cv_.notify_all();
    connection_->close();

    if (reason.is(ErrorCode::Cancelled)) {
        spdlog::debug("transport: connection closed locally");
    } else {
        spdlog::info("transport: connection terminated: {}", reason.message);
    }
    if (on_close_) {
        on_close_(reason);
    }
}

}  // namespace nvrpc::runtime
