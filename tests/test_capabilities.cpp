#include "nvrpc/runtime/capabilities.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace nvrpc::runtime;

TEST(CapabilityCacheTest, QueriesOncePerFeature)
{
    std::vector<std::string> asked;
    CapabilityCache cache{[&](std::string method, Array params) -> Result<Value> {
        EXPECT_EQ(method, "nvim_call_function");
        EXPECT_EQ(params.at(0), Value{"has"});
        auto feature = std::string(*params.at(1).as_array()->at(0).as_string());
        asked.push_back(feature);
        return Value{feature == "nvim-0.10" ? 1 : 0};
    }};

    EXPECT_EQ(cache.has("nvim-0.10"), true);
    EXPECT_EQ(cache.has("nvim-0.10"), true);
    EXPECT_EQ(cache.has("win32"), false);
    EXPECT_EQ(asked, (std::vector<std::string>{"nvim-0.10", "win32"}));
    EXPECT_EQ(cache.cached("win32"), false);
    EXPECT_FALSE(cache.cached("mac"));

    cache.clear();
    EXPECT_FALSE(cache.cached("nvim-0.10"));
    EXPECT_EQ(cache.has("nvim-0.10"), true);
    EXPECT_EQ(asked.size(), 3u);
}

TEST(CapabilityCacheTest, FailuresAreNotCached)
{
    int calls = 0;
    CapabilityCache cache{[&](std::string, Array) -> Result<Value> {
        if (++calls == 1) {
            return unexpected_result<Value>(connection_closed_error());
        }
        return Value{true};
    }};

    auto first = cache.has("python3");
    ASSERT_FALSE(first);
    EXPECT_TRUE(first.error().is(ErrorCode::ConnectionError));
    EXPECT_FALSE(cache.cached("python3"));

    EXPECT_EQ(cache.has("python3"), true);
    EXPECT_EQ(calls, 2);
}

TEST(CapabilityCacheTest, UnexpectedReplyIsProtocolError)
{
    CapabilityCache cache{[](std::string, Array) -> Result<Value> { return Value{"yes"}; }};
    auto result = cache.has("clipboard");
    ASSERT_FALSE(result);
    EXPECT_TRUE(result.error().is(ErrorCode::ProtocolError));
}
