/**
 * @file        someip_union_test.cpp
 * @author      LightAP Development Team
 * @brief       Unit tests for union and treat-as encoding
 * @date        2025-12-02
 * @copyright   Copyright (c) 2025
 */

#include "someip_test_helpers.hpp"

using namespace lap::someip;
using namespace lap::someip::serialization;
using namespace lap::someip::test;

namespace
{
    UnionVariant Variant(const char* name, lap::core::UInt32 discriminant, SchemaTypePtr payload = SchemaTypePtr())
    {
        UnionVariant variant;
        variant.name = name;
        variant.discriminant = discriminant;
        variant.payload = std::move(payload);
        return variant;
    }

    UnionVariant Enumerator(const char* name, lap::core::UInt32 discriminant, lap::core::Int64 encoded)
    {
        UnionVariant variant;
        variant.name = name;
        variant.discriminant = discriminant;
        variant.treatAsValue = Optional<lap::core::Int64>(encoded);
        return variant;
    }
}

class UnionCodecTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        auto shape = SchemaType::CreateUnion("Shape",
            {Variant("none", 0), Variant("circle", 1, types::Float32()), Variant("label", 2, StringType())});
        ASSERT_TRUE(shape.HasValue());
        m_shape = shape.Value();

        auto color = SchemaType::CreateUnion("Color",
            {Enumerator("red", 0, 1), Enumerator("green", 1, 2)},
            Optional<PrimitiveKind>(PrimitiveKind::kUInt8));
        ASSERT_TRUE(color.HasValue());
        m_color = color.Value();
    }

    SchemaTypePtr m_shape;
    SchemaTypePtr m_color;
};

TEST_F(UnionCodecTest, SelectorThenPayload)
{
    Value circle = Value::MakeUnion("circle", Value::MakeFloat32(1.0F));

    auto encoded = Encode(circle, *m_shape, Options::Reference());
    ASSERT_TRUE(encoded.HasValue());
    EXPECT_EQ(encoded.Value(), Bytes({0x00, 0x00, 0x00, 0x01, 0x3F, 0x80, 0x00, 0x00}));

    auto decoded = Decode(View(encoded.Value()), *m_shape, Options::Reference());
    ASSERT_TRUE(decoded.HasValue());
    EXPECT_EQ(decoded.Value(), circle);
}

TEST_F(UnionCodecTest, UnitVariant)
{
    auto encoded = Encode(Value::MakeUnion("none"), *m_shape, Options::Reference());
    ASSERT_TRUE(encoded.HasValue());
    EXPECT_EQ(encoded.Value(), Bytes({0x00, 0x00, 0x00, 0x00}));

    auto decoded = Decode(View(encoded.Value()), *m_shape, Options::Reference());
    ASSERT_TRUE(decoded.HasValue());
    EXPECT_STREQ(decoded.Value().GetVariantName().c_str(), "none");
    EXPECT_FALSE(decoded.Value().HasPayload());
}

TEST_F(UnionCodecTest, StringPayloadKeepsItsLengthField)
{
    Value label = Value::MakeUnion("label", Value::MakeString("ab"));

    auto encoded = Encode(label, *m_shape, Options::Reference());
    ASSERT_TRUE(encoded.HasValue());
    EXPECT_EQ(encoded.Value(), Bytes({0x00, 0x00, 0x00, 0x02, 0x00, 0x00, 0x00, 0x02, 'a', 'b'}));
}

/**
 * @test The selector follows the policy width and byte order
 */
TEST_F(UnionCodecTest, SelectorWidthAndOrder)
{
    OptionsConfig config;
    config.unionSelectorWidth = 1;
    config.byteOrder = ByteOrder::kLittleEndian;
    Options options = MakeOptions(config);

    Value circle = Value::MakeUnion("circle", Value::MakeFloat32(1.0F));
    auto encoded = Encode(circle, *m_shape, options);
    ASSERT_TRUE(encoded.HasValue());
    EXPECT_EQ(encoded.Value(), Bytes({0x01, 0x00, 0x00, 0x80, 0x3F}));

    auto decoded = Decode(View(encoded.Value()), *m_shape, options);
    ASSERT_TRUE(decoded.HasValue());
    EXPECT_EQ(decoded.Value(), circle);
}

TEST_F(UnionCodecTest, UnknownDiscriminant)
{
    ByteBuffer data = Bytes({0x00, 0x00, 0x00, 0x09});
    EXPECT_TRUE(FailsWith(Decode(View(data), *m_shape, Options::Reference()), SomeIpErrc::kUnknownDiscriminant));

    EXPECT_TRUE(FailsWith(Encode(Value::MakeUnion("square"), *m_shape, Options::Reference()),
                          SomeIpErrc::kUnknownDiscriminant));
}

TEST_F(UnionCodecTest, PayloadShape)
{
    EXPECT_TRUE(FailsWith(Encode(Value::MakeUnion("circle"), *m_shape, Options::Reference()),
                          SomeIpErrc::kValueSchemaMismatch));
    EXPECT_TRUE(FailsWith(Encode(Value::MakeUnion("none", Value::MakeUInt8(1)), *m_shape, Options::Reference()),
                          SomeIpErrc::kValueSchemaMismatch));
    EXPECT_TRUE(FailsWith(Encode(Value::MakeUInt8(1), *m_shape, Options::Reference()),
                          SomeIpErrc::kValueSchemaMismatch));
}

TEST_F(UnionCodecTest, InsideTlvStruct)
{
    auto holder = Struct("Holder", {Field(2, "shape", m_shape)}, true);
    Value value = Value::MakeStruct();
    value.SetField("shape", Value::MakeUnion("circle", Value::MakeFloat32(1.0F)));

    auto encoded = Encode(value, *holder, Options::Reference());
    ASSERT_TRUE(encoded.HasValue());
    EXPECT_EQ(encoded.Value(), Bytes({0x60, 0x02, 0x00, 0x00, 0x00, 0x08,
                                      0x00, 0x00, 0x00, 0x01, 0x3F, 0x80, 0x00, 0x00}));

    auto decoded = Decode(View(encoded.Value()), *holder, Options::Reference());
    ASSERT_TRUE(decoded.HasValue());
    EXPECT_EQ(decoded.Value(), value);
}

TEST_F(UnionCodecTest, TlvMemberNeedsLengthField)
{
    OptionsConfig config;
    config.unionLengthWidth = 0;

    auto holder = Struct("Holder", {Field(2, "shape", m_shape)}, true);
    Value value = Value::MakeStruct();
    value.SetField("shape", Value::MakeUnion("none"));

    EXPECT_TRUE(FailsWith(Encode(value, *holder, MakeOptions(config)), SomeIpErrc::kInvalidLengthFieldWidth));
}

// ============================================================================
// treat-as
// ============================================================================

TEST_F(UnionCodecTest, TreatAsEncodesOnlyTheValue)
{
    auto encoded = Encode(Value::MakeUnion("green"), *m_color, Options::Reference());
    ASSERT_TRUE(encoded.HasValue());
    EXPECT_EQ(encoded.Value(), Bytes({0x02}));

    ByteBuffer red = Bytes({0x01});
    auto decoded = Decode(View(red), *m_color, Options::Reference());
    ASSERT_TRUE(decoded.HasValue());
    EXPECT_EQ(decoded.Value(), Value::MakeUnion("red"));
}

TEST_F(UnionCodecTest, TreatAsUnknownValue)
{
    ByteBuffer data = Bytes({0x05});
    EXPECT_TRUE(FailsWith(Decode(View(data), *m_color, Options::Reference()), SomeIpErrc::kUnknownTreatAsValue));
}

TEST_F(UnionCodecTest, TreatAsSignedKind)
{
    auto level = SchemaType::CreateUnion("Level",
        {Enumerator("low", 0, -1), Enumerator("high", 1, 300)},
        Optional<PrimitiveKind>(PrimitiveKind::kInt16));
    ASSERT_TRUE(level.HasValue());

    auto encoded = Encode(Value::MakeUnion("low"), *level.Value(), Options::Reference());
    ASSERT_TRUE(encoded.HasValue());
    EXPECT_EQ(encoded.Value(), Bytes({0xFF, 0xFF}));

    auto decoded = Decode(View(encoded.Value()), *level.Value(), Options::Reference());
    ASSERT_TRUE(decoded.HasValue());
    EXPECT_EQ(decoded.Value(), Value::MakeUnion("low"));
}

/**
 * @test A treat-as member is tagged as a fixed-size value
 */
TEST_F(UnionCodecTest, TreatAsInsideTlvStruct)
{
    auto holder = Struct("Holder", {Field(4, "color", m_color)}, true);
    Value value = Value::MakeStruct();
    value.SetField("color", Value::MakeUnion("green"));

    auto encoded = Encode(value, *holder, Options::Reference());
    ASSERT_TRUE(encoded.HasValue());
    EXPECT_EQ(encoded.Value(), Bytes({0x00, 0x04, 0x02}));

    auto decoded = Decode(View(encoded.Value()), *holder, Options::Reference());
    ASSERT_TRUE(decoded.HasValue());
    EXPECT_EQ(decoded.Value(), value);
}
