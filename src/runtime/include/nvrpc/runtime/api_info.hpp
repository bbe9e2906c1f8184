#pragma once

#include "nvrpc/runtime/result.hpp"
#include "nvrpc/runtime/value.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace nvrpc::runtime
{

struct ApiVersion {
    std::int64_t major = 0;
    std::int64_t minor = 0;
    std::int64_t patch = 0;
    std::int64_t api_level = 0;
};

/// Parsed result of `nvim_get_api_info`: `[channel_id, metadata]`.
struct ApiInfo {
    std::int64_t channel_id = 0;
    /// Ext type name to code, from `metadata["types"]`.
    std::map<std::string, std::int8_t> ext_types;
    /// Error type name to id, from `metadata["error_types"]`.
    std::map<std::string, std::int64_t> error_types;
    std::optional<ApiVersion> version;
    Value metadata;
};

/// Fails with ErrorCode::ProtocolError when the reply does not have the expected shape.
Result<ApiInfo> parse_api_info(const Value& reply);

}  // namespace nvrpc::runtime
