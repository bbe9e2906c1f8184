#include "nvrpc/runtime/api_info.hpp"

#include "fake_peer.hpp"

#include <gtest/gtest.h>

using namespace nvrpc::runtime;
using nvrpc::test::make_metadata;

TEST(ApiInfoTest, ParsesChannelTypesAndVersion)
{
    Value reply{Array{Value{3}, make_metadata({{"Buffer", 0}, {"Window", 1}, {"Tabpage", 2}})}};

    auto info = parse_api_info(reply);
    ASSERT_TRUE(info) << info.error().message;
    EXPECT_EQ(info->channel_id, 3);
    ASSERT_EQ(info->ext_types.size(), 3u);
    EXPECT_EQ(info->ext_types.at("Buffer"), 0);
    EXPECT_EQ(info->ext_types.at("Tabpage"), 2);
    EXPECT_EQ(info->error_types.at("Validation"), 1);
    ASSERT_TRUE(info->version);
    EXPECT_EQ(info->version->minor, 10);
    EXPECT_EQ(info->version->api_level, 12);
    EXPECT_NE(info->metadata.find("types"), nullptr);
}

TEST(ApiInfoTest, RejectsMalformedReplies)
{
    auto expect_protocol_error = [](const Value& reply) {
        auto info = parse_api_info(reply);
        ASSERT_FALSE(info);
        EXPECT_TRUE(info.error().is(ErrorCode::ProtocolError)) << info.error().message;
    };

    expect_protocol_error(Value{"not an array"});
    expect_protocol_error(Value{Array{Value{3}}});
    expect_protocol_error(Value{Array{Value{"three"}, make_metadata({})}});
    expect_protocol_error(Value{Array{Value{3}, Value{Array{}}}});
    // no types map
    expect_protocol_error(Value{Array{Value{3}, Value{Map{}}}});
    // type without an id
    expect_protocol_error(Value{Array{
        Value{3},
        Value{Map{{Value{"types"}, Value{Map{{Value{"Buffer"}, Value{Map{}}}}}}}},
    }});
    // ext code out of int8 range
    expect_protocol_error(Value{Array{Value{3}, make_metadata({{"Buffer", 300}})}});
}
