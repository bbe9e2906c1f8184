#include "nvrpc/runtime/capabilities.hpp"

#include <spdlog/spdlog.h>
#include <fmt/core.h>

#include <utility>

namespace nvrpc::runtime
{

CapabilityCache::CapabilityCache(RequestFn request)
    : request_(std::move(request))
{
}

Result<bool> CapabilityCache::has(std::string_view feature)
{
    if (auto hit = cached(feature)) {
        return *hit;
    }

    auto reply = request_("nvim_call_function", Array{Value{"has"}, Value{Array{Value{feature}}}});
    if (!reply) {
        return std::unexpected(reply.error());
    }

    bool present = false;
    if (auto number = reply->as_int64()) {
        present = *number != 0;
    } else if (auto flag = reply->as_bool()) {
        present = *flag;
    } else {
        return protocol_error<bool>(fmt::format("has({}) returned {}", feature, to_string(*reply)));
    }

    spdlog::debug("capabilities: has({}) = {}", feature, present);
    std::lock_guard lock(mutex_);
    features_.insert_or_assign(std::string(feature), present);
    return present;
}

std::optional<bool> CapabilityCache::cached(std::string_view feature) const
{
    std::lock_guard lock(mutex_);
    if (auto it = features_.find(feature); it != features_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void CapabilityCache::clear()
{
    std::lock_guard lock(mutex_);
    features_.clear();
}

}  // namespace nvrpc::runtime
