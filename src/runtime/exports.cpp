#include "nvrpc/runtime/exports.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace nvrpc::runtime
{
namespace
{

std::string random_hex()
{
    thread_local boost::uuids::random_generator generator;
    auto text = boost::uuids::to_string(generator());
    text.erase(std::remove(text.begin(), text.end(), '-'), text.end());
    return text;
}

}  // namespace

RemoteExport make_export(std::string name, bool blocking)
{
    auto remote = fmt::format("{}_{}", name, random_hex());
    std::replace(remote.begin(), remote.end(), '.', '_');
    std::transform(remote.begin(), remote.end(), remote.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (!remote.empty()) {
        remote[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(remote[0])));
    }
    return RemoteExport{std::move(name), std::move(remote), blocking};
}

std::string lua_binding(std::int64_t channel, const RemoteExport& exported)
{
    const char* op = exported.blocking ? "request" : "notify";
    return fmt::format("{} = function (...) return vim.rpc{}({}, '{}', {{...}}) end",
                       exported.remote_name,
                       op,
                       channel,
                       exported.name);
}

std::string viml_binding(const RemoteExport& exported)
{
    return fmt::format("function! {0}(...)\n  call v:lua.{0}(a:000)\nendfunction", exported.remote_name);
}

}  // namespace nvrpc::runtime
