#pragma once

#include "nvrpc/runtime/result.hpp"
#include "nvrpc/runtime/value.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace nvrpc::runtime
{

/**
 * @brief Per-client memo of `has(feature)` answers.
 *
 * The first query for a feature asks the peer through `nvim_call_function("has", ...)`;
 * later queries are answered from the cache. Failed queries are not cached.
 */
class CapabilityCache
{
public:
    using RequestFn = std::function<Result<Value>(std::string method, Array params)>;

    explicit CapabilityCache(RequestFn request);

    Result<bool> has(std::string_view feature);

    std::optional<bool> cached(std::string_view feature) const;
    void clear();

private:
    RequestFn request_;
    mutable std::mutex mutex_;
    std::map<std::string, bool, std::less<>> features_;
};

}  // namespace nvrpc::runtime
