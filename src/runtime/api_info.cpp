#include "nvrpc/runtime/api_info.hpp"

#include <fmt/core.h>

#include <limits>
#include <utility>

namespace nvrpc::runtime
{
namespace
{

Result<std::int64_t> read_id(const Value& entry, std::string_view section, std::string_view name)
{
    const auto* id = entry.find("id");
    if (!id) {
        return protocol_error<std::int64_t>(fmt::format("metadata {}.{} has no id", section, name));
    }
    auto value = id->as_int64();
    if (!value) {
        return protocol_error<std::int64_t>(fmt::format("metadata {}.{}.id is not an integer", section, name));
    }
    return *value;
}

std::optional<ApiVersion> read_version(const Value& metadata)
{
    const auto* version = metadata.find("version");
    if (!version || !version->as_map()) {
        return std::nullopt;
    }
    ApiVersion result;
    auto field = [version](std::string_view key) -> std::int64_t {
        const auto* v = version->find(key);
        return v ? v->as_int64().value_or(0) : 0;
    };
    result.major = field("major");
    result.minor = field("minor");
    result.patch = field("patch");
    result.api_level = field("api_level");
    return result;
}

}  // namespace

Result<ApiInfo> parse_api_info(const Value& reply)
{
    const auto* items = reply.as_array();
    if (!items || items->size() != 2) {
        return protocol_error<ApiInfo>("api info is not a [channel_id, metadata] pair");
    }

    ApiInfo info;
    auto channel = (*items)[0].as_int64();
    if (!channel) {
        return protocol_error<ApiInfo>("api info channel id is not an integer");
    }
    info.channel_id = *channel;

    const auto& metadata = (*items)[1];
    if (!metadata.as_map()) {
        return protocol_error<ApiInfo>("api metadata is not a map");
    }

    const auto* types = metadata.find("types");
    if (!types || !types->as_map()) {
        return protocol_error<ApiInfo>("api metadata has no types map");
    }
    for (const auto& [key, entry] : *types->as_map()) {
        auto name = key.as_string();
        if (!name) {
            return protocol_error<ApiInfo>("api metadata type name is not a string");
        }
        auto id = read_id(entry, "types", *name);
        if (!id) {
            return std::unexpected(id.error());
        }
        if (*id < std::numeric_limits<std::int8_t>::min() || *id > std::numeric_limits<std::int8_t>::max()) {
            return protocol_error<ApiInfo>(fmt::format("ext type {} has out of range code {}", *name, *id));
        }
        info.ext_types.emplace(std::string(*name), static_cast<std::int8_t>(*id));
    }

    const auto* error_types = metadata.find("error_types");
    if (!error_types || !error_types->as_map()) {
        return protocol_error<ApiInfo>("api metadata has no error_types map");
    }
    for (const auto& [key, entry] : *error_types->as_map()) {
        auto name = key.as_string();
        if (!name) {
            return protocol_error<ApiInfo>("api metadata error type name is not a string");
        }
        auto id = read_id(entry, "error_types", *name);
        if (!id) {
            return std::unexpected(id.error());
        }
        info.error_types.emplace(std::string(*name), *id);
    }

    info.version = read_version(metadata);
    info.metadata = metadata;
    return info;
}

}  // namespace nvrpc::runtime
