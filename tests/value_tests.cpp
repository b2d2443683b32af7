#include <cstdint>
#include <limits>
#include <sstream>

#include <gtest/gtest.h>

#include "vine/vm/types.hpp"
#include "vine/vm/value.hpp"

using vine::Handle;
using vine::Value;

TEST(Value, DefaultIsRawZero)
{
    const Value v;
    EXPECT_TRUE(v.isRaw());
    EXPECT_FALSE(v.isReference());
    EXPECT_EQ(v.asRaw(), 0u);
}

TEST(Value, UnsignedConversionsZeroExtend)
{
    EXPECT_EQ(Value::fromUnsigned<uint8_t>(0xFF).asRaw(), 0xFFu);
    EXPECT_EQ(Value::fromUnsigned<uint16_t>(0xBEEF).asRaw(), 0xBEEFu);
    EXPECT_EQ(Value::fromUnsigned<uint32_t>(0xFFFFFFFFu).asRaw(), 0xFFFFFFFFull);
    EXPECT_EQ(Value::fromUnsigned<uint64_t>(std::numeric_limits<uint64_t>::max()).asRaw(),
              std::numeric_limits<uint64_t>::max());
}

TEST(Value, SignedConversionsSignExtend)
{
    EXPECT_EQ(Value::fromSigned<int8_t>(-1).asRaw(), std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(Value::fromSigned<int32_t>(-2).asInt64(), -2);
    EXPECT_EQ(Value::fromSigned<int16_t>(1234).asRaw(), 1234u);
    EXPECT_EQ(Value::fromSigned<int64_t>(std::numeric_limits<int64_t>::min()).asInt64(),
              std::numeric_limits<int64_t>::min());
}

TEST(Value, FloatKeepsItsBitPattern)
{
    const Value v = Value::fromFloat(1.5f);
    EXPECT_EQ(v.asRaw(), 0x3FC00000u);
    EXPECT_FLOAT_EQ(v.asFloat(), 1.5f);
}

TEST(Value, DoubleKeepsItsBitPattern)
{
    const Value v = Value::fromDouble(1.0);
    EXPECT_EQ(v.asRaw(), 0x3FF0000000000000ull);
    EXPECT_DOUBLE_EQ(Value::fromDouble(-2.25).asDouble(), -2.25);
}

TEST(Value, EqualityComparesTagAndPayload)
{
    const Handle h{0, 0};
    EXPECT_EQ(Value::makeRaw(7), Value::makeRaw(7));
    EXPECT_NE(Value::makeRaw(7), Value::makeRaw(8));
    EXPECT_NE(Value::makeRaw(0), Value::makeReference(h));
    EXPECT_EQ(Value::makeReference(Handle{3, 1}), Value::makeReference(Handle{3, 1}));
    EXPECT_NE(Value::makeReference(Handle{3, 1}), Value::makeReference(Handle{3, 2}));
}

TEST(Value, ToStringShowsTagAndPayload)
{
    EXPECT_EQ(vine::valueToString(Value::makeRaw(5)), "Raw(5)");
    EXPECT_EQ(vine::valueToString(Value::makeReference(Handle{3, 1})), "Ref(#3:1)");

    std::ostringstream out;
    out << Value::makeRaw(42);
    EXPECT_EQ(out.str(), "Raw(42)");
}

TEST(Value, FaultNamesAreReadable)
{
    EXPECT_STREQ(vine::faultToString(vine::Fault::DIVISION_BY_ZERO), "division by zero");
    EXPECT_STREQ(vine::faultToString(vine::Fault::STACK_OVERFLOW), "stack overflow");
    EXPECT_STREQ(vine::machineStateToString(vine::MachineState::HALTED), "halted");
}
