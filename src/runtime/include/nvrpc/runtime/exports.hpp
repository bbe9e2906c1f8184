#pragma once

#include <cstdint>
#include <string>

namespace nvrpc::runtime
{

/**
 * @brief A local handler made callable from the peer's scripting side.
 *
 * `remote_name` is a globally unique function name derived from `name`. Blocking
 * exports are installed as `vim.rpcrequest` wrappers, the others as `vim.rpcnotify`.
 */
struct RemoteExport {
    std::string name;
    std::string remote_name;
    bool blocking = false;
};

RemoteExport make_export(std::string name, bool blocking);

/// `Remote_name = function (...) return vim.rpcrequest(chan, 'name', {...}) end`
std::string lua_binding(std::int64_t channel, const RemoteExport& exported);

/// `function! Remote_name(...)` forwarding its arguments to the Lua function.
std::string viml_binding(const RemoteExport& exported);

}  // namespace nvrpc::runtime
