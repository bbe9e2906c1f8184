#pragma once

#include "nvrpc/runtime/result.hpp"
#include "nvrpc/runtime/value.hpp"

#include <nlohmann/json_fwd.hpp>

namespace nvrpc
{

/**
 * @brief Produce a JSON representation of a msgpack value for display.
 *
 * Binary becomes an array of bytes, ext values become
 * `{"ext": <kind>, "code": <n>, "data": [bytes]}` and maps with non-string keys
 * become arrays of `[key, value]` pairs.
 */
nlohmann::json to_json(const runtime::Value& value);

/**
 * @brief Convert JSON given on the command line into a msgpack value.
 *
 * An object holding exactly the keys `ext`, `code` and `data` is read back as an
 * ext value so that handles printed by `to_json` can be passed to later calls.
 */
runtime::Result<runtime::Value> from_json(const nlohmann::json& json);

}  // namespace nvrpc
