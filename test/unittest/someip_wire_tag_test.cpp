/**
 * @file        someip_wire_tag_test.cpp
 * @author      LightAP Development Team
 * @brief       Unit tests for the TLV tag codec
 * @date        2025-12-02
 * @copyright   Copyright (c) 2025
 */

#include "someip_test_helpers.hpp"

using namespace lap::someip;
using namespace lap::someip::serialization;
using namespace lap::someip::test;

/**
 * @test Tag layout matches the reference example
 */
TEST(WireTagTest, PackReferenceTags)
{
    auto first = WireTag::Pack(WireType::kFixed32, 0);
    ASSERT_TRUE(first.HasValue());
    EXPECT_EQ(first.Value()[0], 0x20);
    EXPECT_EQ(first.Value()[1], 0x00);

    auto second = WireTag::Pack(WireType::kFixed32, 1);
    ASSERT_TRUE(second.HasValue());
    EXPECT_EQ(second.Value()[0], 0x20);
    EXPECT_EQ(second.Value()[1], 0x01);
}

/**
 * @test Upper id bits share the first byte with the wire type
 */
TEST(WireTagTest, PackHighIdBits)
{
    auto tag = WireTag::Pack(WireType::kLength16, 0xABC);
    ASSERT_TRUE(tag.HasValue());
    EXPECT_EQ(tag.Value()[0], 0x5A);
    EXPECT_EQ(tag.Value()[1], 0xBC);

    auto max = WireTag::Pack(WireType::kComplex, kMaxDataId);
    ASSERT_TRUE(max.HasValue());
    EXPECT_EQ(max.Value()[0], 0x7F);
    EXPECT_EQ(max.Value()[1], 0xFF);
}

TEST(WireTagTest, PackRejectsWideId)
{
    EXPECT_TRUE(FailsWith(WireTag::Pack(WireType::kFixed8, 0x1000), SomeIpErrc::kFieldIdOutOfRange));
}

TEST(WireTagTest, Unpack)
{
    auto tag = WireTag::Unpack(0x6F, 0xFE);
    ASSERT_TRUE(tag.HasValue());
    EXPECT_EQ(tag.Value().wireType, WireType::kLength32);
    EXPECT_EQ(tag.Value().dataId, 0xFFE);
}

/**
 * @test Wire types 8..15 are reserved
 */
TEST(WireTagTest, UnpackReservedWireType)
{
    for (lap::core::UInt8 wire = 8; wire < 16; ++wire)
    {
        auto tag = WireTag::Unpack(static_cast<lap::core::UInt8>(wire << 4), 0x01);
        EXPECT_TRUE(FailsWith(tag, SomeIpErrc::kUnsupportedWireType)) << "wire type " << int(wire);
    }
}

TEST(WireTagTest, SizeTables)
{
    EXPECT_EQ(FixedSizeOf(WireType::kFixed8), 1u);
    EXPECT_EQ(FixedSizeOf(WireType::kFixed64), 8u);
    EXPECT_EQ(FixedSizeOf(WireType::kLength8), 0u);
    EXPECT_EQ(LengthFieldWidthOf(WireType::kLength8), 1);
    EXPECT_EQ(LengthFieldWidthOf(WireType::kLength16), 2);
    EXPECT_EQ(LengthFieldWidthOf(WireType::kLength32), 4);
    EXPECT_EQ(LengthFieldWidthOf(WireType::kComplex), 0);
    EXPECT_EQ(WireTypeForLengthField(0), WireType::kComplex);
    EXPECT_EQ(WireTypeForLengthField(2), WireType::kLength16);
    EXPECT_EQ(WireTypeForFixedSize(8), WireType::kFixed64);
    EXPECT_TRUE(IsLengthDelimited(WireType::kLength8));
    EXPECT_FALSE(IsLengthDelimited(WireType::kComplex));
}
