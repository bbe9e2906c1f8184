#include "nvrpc/runtime/exports.hpp"

#include <gtest/gtest.h>

#include <cctype>
#include <regex>

using namespace nvrpc::runtime;

TEST(ExportsTest, RemoteNameIsUniqueAndCapitalized)
{
    auto first = make_export("my.plugin.Handler", true);
    auto second = make_export("my.plugin.Handler", true);

    EXPECT_EQ(first.name, "my.plugin.Handler");
    EXPECT_TRUE(first.blocking);
    EXPECT_NE(first.remote_name, second.remote_name);
    EXPECT_TRUE(std::regex_match(first.remote_name, std::regex("My_plugin_handler_[0-9a-f]{32}")))
        << first.remote_name;
}

TEST(ExportsTest, LuaBindingUsesRequestOrNotify)
{
    RemoteExport blocking{"ping", "Ping_abc", true};
    EXPECT_EQ(lua_binding(3, blocking), "Ping_abc = function (...) return vim.rpcrequest(3, 'ping', {...}) end");

    RemoteExport async{"log", "Log_abc", false};
    EXPECT_EQ(lua_binding(7, async), "Log_abc = function (...) return vim.rpcnotify(7, 'log', {...}) end");
}

TEST(ExportsTest, VimlBindingForwardsToLua)
{
    RemoteExport exported{"ping", "Ping_abc", true};
    EXPECT_EQ(viml_binding(exported), "function! Ping_abc(...)\n  call v:lua.Ping_abc(a:000)\nendfunction");
}
