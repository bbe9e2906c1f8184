#include "nvrpc/runtime/value.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

using namespace nvrpc::runtime;

TEST(ValueTest, DefaultIsNil)
{
    Value value;
    EXPECT_TRUE(value.is_nil());
    EXPECT_EQ(value.kind(), ValueKind::Nil);
    EXPECT_EQ(Value{nullptr}, value);
}

TEST(ValueTest, UnsignedThatFitsIsStoredSigned)
{
    Value small{std::uint64_t{42}};
    EXPECT_EQ(small.kind(), ValueKind::Integer);
    EXPECT_EQ(small, Value{42});
    EXPECT_EQ(small.as_uint64(), 42u);

    Value big{std::numeric_limits<std::uint64_t>::max()};
    EXPECT_EQ(big.kind(), ValueKind::Unsigned);
    EXPECT_FALSE(big.as_int64());
    EXPECT_EQ(big.as_uint64(), std::numeric_limits<std::uint64_t>::max());

    Value negative{-7};
    EXPECT_TRUE(negative.is_integer());
    EXPECT_FALSE(negative.as_uint64());
}

TEST(ValueTest, BoolIsNotAnInteger)
{
    Value flag{true};
    EXPECT_EQ(flag.kind(), ValueKind::Boolean);
    EXPECT_FALSE(flag.is_integer());
    EXPECT_EQ(flag.as_bool(), true);
}

TEST(ValueTest, TypedAccessorsRejectOtherKinds)
{
    Value text{"hello"};
    EXPECT_EQ(text.as_string(), "hello");
    EXPECT_FALSE(text.as_int64());
    EXPECT_EQ(text.as_array(), nullptr);
    EXPECT_EQ(text.as_map(), nullptr);
    EXPECT_EQ(text.as_ext(), nullptr);
}

TEST(ValueTest, FindLooksUpStringKeys)
{
    Value map{Map{
        {Value{1}, Value{"by number"}},
        {Value{"id"}, Value{3}},
    }};
    ASSERT_NE(map.find("id"), nullptr);
    EXPECT_EQ(*map.find("id"), Value{3});
    EXPECT_EQ(map.find("missing"), nullptr);
    EXPECT_EQ(Value{Array{}}.find("id"), nullptr);
}

TEST(ValueTest, ExtEqualityIgnoresKind)
{
    Value lhs{ExtValue{0, Binary{0x01}, "Buffer"}};
    Value rhs{ExtValue{0, Binary{0x01}, ""}};
    EXPECT_EQ(lhs, rhs);
    EXPECT_NE(lhs, (Value{ExtValue{1, Binary{0x01}, "Buffer"}}));
    EXPECT_NE(lhs, (Value{ExtValue{0, Binary{0x02}, "Buffer"}}));
}

TEST(ValueTest, ToStringRendersNestedValues)
{
    Value value{Array{
        Value{},
        Value{true},
        Value{-1},
        Value{"a\"b"},
        Value{Binary{0xde, 0xad}},
        Value{Map{{Value{"k"}, Value{ExtValue{2, Binary{0x05}, "Tabpage"}}}}},
    }};
    EXPECT_EQ(to_string(value), R"([nil, true, -1, "a\"b", b'dead', {"k": Tabpage(2, 05)}])");
    EXPECT_EQ(to_string(ValueKind::Unsigned), "unsigned");
}
