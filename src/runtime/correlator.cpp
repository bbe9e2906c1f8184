#include "nvrpc/runtime/correlator.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace nvrpc::runtime
{

Correlator::Correlator(SendFn send)
    : send_(std::move(send))
{
}

Result<PendingCall> Correlator::submit(std::string method, Array params)
{
    const auto id = next_id_.fetch_add(1, std::memory_order_relaxed);

    std::promise<Result<Value>> promise;
    PendingCall call{id, promise.get_future()};
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return unexpected_result<PendingCall>(close_reason_);
        }
        calls_.emplace(id, std::move(promise));
    }

    spdlog::debug("rpc: request id={} method={}", id, method);
    if (auto res = send_(Request{id, std::move(method), std::move(params)}); !res) {
        std::lock_guard lock(mutex_);
        calls_.erase(id);
        return std::unexpected(res.error());
    }
    return call;
}

bool Correlator::resolve(Response response)
{
    std::promise<Result<Value>> promise;
    {
        std::lock_guard lock(mutex_);
        auto it = calls_.find(response.id);
        if (it == calls_.end()) {
            spdlog::warn("rpc: dropping response id={} with no pending request", response.id);
            return false;
        }
        promise = std::move(it->second);
        calls_.erase(it);
    }

    if (!response.error.is_nil()) {
        promise.set_value(unexpected_result<Value>(remote_error(std::move(response.error))));
    } else {
        promise.set_value(std::move(response.result));
    }
    return true;
}

bool Correlator::cancel(std::uint64_t id, Error reason)
{
    std::promise<Result<Value>> promise;
    {
        std::lock_guard lock(mutex_);
        auto it = calls_.find(id);
        if (it == calls_.end()) {
            return false;
        }
        promise = std::move(it->second);
        calls_.erase(it);
    }
    promise.set_value(unexpected_result<Value>(std::move(reason)));
    return true;
}

void Correlator::reject_all(const Error& reason)
{
    std::unordered_map<std::uint64_t, std::promise<Result<Value>>> calls;
    {
        std::lock_guard lock(mutex_);
        if (!closed_) {
            closed_ = true;
            close_reason_ = reason;
        }
        calls.swap(calls_);
    }
    if (!calls.empty()) {
        spdlog::debug("rpc: rejecting {} pending request(s): {}", calls.size(), reason.message);
    }
    for (auto& [id, promise] : calls) {
        promise.set_value(unexpected_result<Value>(reason));
    }
}

std::size_t Correlator::pending() const
{
    std::lock_guard lock(mutex_);
    return calls_.size();
}

bool Correlator::closed() const
{
    std::lock_guard lock(mutex_);
    return closed_;
}

}  // namespace nvrpc::runtime
