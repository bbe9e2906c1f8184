#pragma once

#include "nvrpc/runtime/codec.hpp"
#include "nvrpc/runtime/connection.hpp"
#include "nvrpc/runtime/message.hpp"
#include "nvrpc/runtime/result.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace nvrpc::runtime
{

struct TransportConfig {
    std::size_t read_chunk_size = 1'000'000;
};

/**
 * @brief Drives one connection with a send loop and a receive loop.
 *
 * The send loop writes queued chunks in FIFO order, coalescing them until the queue
 * runs dry or a flush marker is reached. The receive loop feeds every chunk it reads
 * into a streaming Decoder and hands out frames as soon as they are complete.
 *
 * The close callback fires exactly once, from whichever loop observed the termination:
 * peer hang-up, I/O failure, a protocol error, or a local close().
 */
class Transport
{
public:
    using FrameCallback = std::function<void(Frame&&)>;
    using CloseCallback = std::function<void(const Error&)>;

    Transport(std::shared_ptr<Connection> connection,
              std::shared_ptr<const ExtTypeRegistry> registry,
              FrameCallback on_frame,
              CloseCallback on_close,
              TransportConfig config = {});
    ~Transport();

    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    void start();

    Result<void> send(std::vector<std::uint8_t> chunk);
    Result<void> flush();

    // Writes what is already queued, then closes the connection. Idempotent.
    void close();
    // Safe to call from several threads and from a frame or close callback; a loop
    // thread skips joining itself.
    void join();

    bool is_closed() const { return finished_.load(std::memory_order_acquire); }

private:
    Result<void> enqueue(std::optional<std::vector<std::uint8_t>> item);
    void send_loop();
    void receive_loop();
    void finish(const Error& reason);
    void join_loop(std::once_flag& joined, std::thread& loop);

    std::shared_ptr<Connection> connection_;
    Decoder decoder_;
    FrameCallback on_frame_;
    CloseCallback on_close_;
    TransportConfig config_;

    std::mutex mutex_;
    std::condition_variable cv_;
    // An empty optional is a flush marker.
    std::deque<std::optional<std::vector<std::uint8_t>>> queue_;
    bool stopping_ = false;

    std::atomic<bool> started_{false};
    std::atomic<bool> finished_{false};
    std::thread send_thread_;
    std::thread receive_thread_;
    std::once_flag send_joined_;
    std::once_flag receive_joined_;
};

}  // namespace nvrpc::runtime
