#pragma once

#include "nvrpc/runtime/message.hpp"
#include "nvrpc/runtime/result.hpp"
#include "nvrpc/runtime/value.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

namespace nvrpc::runtime
{

struct PendingCall {
    std::uint64_t id = 0;
    std::future<Result<Value>> future;
};

/**
 * @brief Matches outbound requests with the responses that settle them.
 *
 * Every PendingCall is settled exactly once: by `resolve`, by `cancel`, or by
 * `reject_all` when the connection goes away. After `reject_all` new submissions fail
 * immediately.
 */
class Correlator
{
public:
    using SendFn = std::function<Result<void>(const Frame&)>;

    explicit Correlator(SendFn send);

    Result<PendingCall> submit(std::string method, Array params);

    // Returns false when no call is waiting for `response.id`; the response is dropped.
    bool resolve(Response response);

    bool cancel(std::uint64_t id, Error reason);

    void reject_all(const Error& reason);

    std::size_t pending() const;
    bool closed() const;

private:
    SendFn send_;
    std::atomic<std::uint64_t> next_id_{1};
    mutable std::mutex mutex_;
    std::unordered_map<std::uint64_t, std::promise<Result<Value>>> calls_;
    bool closed_ = false;
    Error close_reason_;
};

}  // namespace nvrpc::runtime
