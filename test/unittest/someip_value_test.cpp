/**
 * @file        someip_value_test.cpp
 * @author      LightAP Development Team
 * @brief       Unit tests for the dynamic value model
 * @date        2025-12-02
 * @copyright   Copyright (c) 2025
 */

#include "someip_test_helpers.hpp"

using namespace lap::someip;
using namespace lap::someip::serialization;
using namespace lap::someip::test;

TEST(ValueTest, SignedIntegersKeepTheirValue)
{
    EXPECT_EQ(Value::MakeInt8(-1).AsInt64(), -1);
    EXPECT_EQ(Value::MakeInt8(-1).GetBits(), 0xFFu);
    EXPECT_EQ(Value::MakeInt16(-300).AsInt64(), -300);
    EXPECT_EQ(Value::MakeInt32(-70000).AsInt64(), -70000);
    EXPECT_EQ(Value::MakeInt64(-5).AsInt64(), -5);
    EXPECT_EQ(Value::MakeUInt16(0xFFFF).AsUInt64(), 0xFFFFu);
}

TEST(ValueTest, PrimitiveBitsAreMasked)
{
    Value value = Value::MakePrimitive(PrimitiveKind::kUInt8, 0x1234);
    EXPECT_EQ(value.GetBits(), 0x34u);
    EXPECT_EQ(value.GetPrimitiveKind(), PrimitiveKind::kUInt8);

    EXPECT_TRUE(Value::MakePrimitive(PrimitiveKind::kBool, 2).AsBool());
    EXPECT_EQ(Value::MakePrimitive(PrimitiveKind::kBool, 2).GetBits(), 1u);
}

TEST(ValueTest, Floats)
{
    EXPECT_FLOAT_EQ(static_cast<float>(Value::MakeFloat32(1.5F).AsDouble()), 1.5F);
    EXPECT_DOUBLE_EQ(Value::MakeFloat64(-2.25).AsDouble(), -2.25);
    EXPECT_EQ(Value::MakeFloat32(1.0F).GetBits(), 0x3F800000u);
}

/**
 * @test Struct equality ignores member order
 */
TEST(ValueTest, StructEquality)
{
    Value first = Value::MakeStruct();
    first.SetField("x", Value::MakeInt32(1)).SetField("y", Value::MakeInt32(2));

    Value second = Value::MakeStruct();
    second.SetField("y", Value::MakeInt32(2)).SetField("x", Value::MakeInt32(1));

    EXPECT_EQ(first, second);

    second.SetField("y", Value::MakeInt32(3));
    EXPECT_NE(first, second);
    EXPECT_EQ(second.GetFieldCount(), 2u);

    Value partial = Value::MakeStruct();
    partial.SetField("x", Value::MakeInt32(1));
    EXPECT_NE(first, partial);
}

TEST(ValueTest, KindsDiffer)
{
    EXPECT_NE(Value::MakeInt32(1), Value::MakeUInt32(1));
    EXPECT_NE(Value::MakeString("1"), Value::MakeInt32(1));
    EXPECT_NE(Value::MakeUnion("a"), Value::MakeUnion("a", Value::MakeBool(true)));
}

TEST(ValueTest, FindField)
{
    Value value = Value::MakeStruct();
    value.SetField("name", Value::MakeString("abc"));

    ASSERT_NE(value.FindField("name"), nullptr);
    EXPECT_STREQ(value.FindField("name")->GetText().c_str(), "abc");
    EXPECT_EQ(value.FindField("other"), nullptr);
}

TEST(ValueTest, Format)
{
    Value inner = Value::MakeSequence({Value::MakeUInt8(1), Value::MakeUInt8(2)});
    Value value = Value::MakeStruct();
    value.SetField("flag", Value::MakeBool(true))
         .SetField("temp", Value::MakeInt16(-4))
         .SetField("name", Value::MakeString("ecu"))
         .SetField("data", inner)
         .SetField("mode", Value::MakeUnion("on", Value::MakeUInt16(3)));

    EXPECT_STREQ(FormatValue(value).c_str(),
                 "{flag: true, temp: -4, name: \"ecu\", data: [1, 2], mode: on(3)}");
}
