/**
 * @file        someip_serializer_test.cpp
 * @author      LightAP Development Team
 * @brief       Unit tests for the Encode/Decode facade
 * @date        2025-12-02
 * @copyright   Copyright (c) 2025
 */

#include "someip_test_helpers.hpp"

#include <atomic>
#include <set>
#include <thread>
#include <vector>

using namespace lap::someip;
using namespace lap::someip::serialization;
using namespace lap::someip::test;

class SerializerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        UnionVariant idle;
        idle.name = "idle";
        idle.discriminant = 0;
        UnionVariant busy;
        busy.name = "busy";
        busy.discriminant = 1;
        busy.payload = types::UInt16();

        auto state = SchemaType::CreateUnion("State", {idle, busy});
        ASSERT_TRUE(state.HasValue());

        m_message = Struct("Status",
            {Field(0, "origin", PointSchema()),
             Field(1, "name", StringType()),
             Field(2, "samples", Sequence(types::Int16())),
             Field(3, "state", state.Value()),
             Field(4, "active", types::Bool(), true)},
            true);

        m_value = Value::MakeStruct();
        Value origin = Value::MakeStruct();
        origin.SetField("x", Value::MakeInt32(-5)).SetField("y", Value::MakeInt32(9));
        m_value.SetField("origin", origin)
               .SetField("name", Value::MakeString("sensor"))
               .SetField("samples", Value::MakeSequence({Value::MakeInt16(-1), Value::MakeInt16(2)}))
               .SetField("state", Value::MakeUnion("busy", Value::MakeUInt16(40)));
    }

    SchemaTypePtr m_message;
    Value m_value;
};

TEST_F(SerializerTest, CompositeMessage)
{
    auto encoded = Encode(m_value, *m_message, Options::Reference());
    ASSERT_TRUE(encoded.HasValue());

    auto decoded = Decode(View(encoded.Value()), *m_message, Options::Reference());
    ASSERT_TRUE(decoded.HasValue());
    EXPECT_EQ(decoded.Value(), m_value);
    EXPECT_EQ(decoded.Value().FindField("active"), nullptr);
}

/**
 * @test Every strict prefix fails: inside an entry the input ends early, at an entry
 *       boundary the remaining mandatory members are missing
 */
TEST_F(SerializerTest, EveryTruncationFails)
{
    OptionsConfig smallest;
    smallest.tlvLengthSelection = LengthSelection::kSmallest;
    const Options policies[] = {Options::Reference(), MakeOptions(smallest)};

    for (const Options& options : policies)
    {
        auto encoded = Encode(m_value, *m_message, options);
        ASSERT_TRUE(encoded.HasValue());
        const ByteBuffer& full = encoded.Value();

        auto entries = ScanTlvEntries(View(full));
        ASSERT_TRUE(entries.HasValue());
        ASSERT_EQ(entries.Value().size(), 4u);

        std::set<lap::core::Size> boundaries;
        for (const auto& entry : entries.Value())
        {
            boundaries.insert(entry.offset);
        }

        for (lap::core::Size length = 0; length < full.size(); ++length)
        {
            auto decoded = Decode(ByteView(full.data(), length), *m_message, options);
            SomeIpErrc expected = boundaries.count(length) != 0 ? SomeIpErrc::kMissingMandatoryField
                                                                : SomeIpErrc::kUnexpectedEndOfInput;
            EXPECT_TRUE(FailsWith(decoded, expected))
                << "prefix of " << length << " bytes, selection " << static_cast<int>(options.GetTlvLengthSelection());
        }
    }
}

/**
 * @test Encoding appends to existing contents
 */
TEST_F(SerializerTest, EncodeIntoAppends)
{
    ByteBuffer buffer = Bytes({0xDE, 0xAD});

    ASSERT_TRUE(EncodeInto(Value::MakeUInt16(0x0102), *types::UInt16(), Options::Reference(), buffer).HasValue());
    EXPECT_EQ(buffer, Bytes({0xDE, 0xAD, 0x01, 0x02}));
}

TEST_F(SerializerTest, EncodeIntoRestoresOnError)
{
    ByteBuffer buffer = Bytes({0xDE, 0xAD});

    Value broken = m_value;
    broken.SetField("state", Value::MakeUnion("unknown"));

    EXPECT_TRUE(FailsWith(EncodeInto(broken, *m_message, Options::Reference(), buffer),
                          SomeIpErrc::kUnknownDiscriminant));
    EXPECT_EQ(buffer, Bytes({0xDE, 0xAD}));
}

TEST_F(SerializerTest, TrailingBytes)
{
    ByteBuffer data = Bytes({0x00, 0x00, 0x00, 0x01, 0xFF});
    EXPECT_TRUE(FailsWith(Decode(View(data), *types::UInt32(), Options::Reference()), SomeIpErrc::kLengthMismatch));
}

TEST_F(SerializerTest, EmptyInput)
{
    ByteBuffer data;
    EXPECT_TRUE(FailsWith(Decode(View(data), *types::UInt8(), Options::Reference()),
                          SomeIpErrc::kUnexpectedEndOfInput));
}

TEST_F(SerializerTest, ScanTlvEntries)
{
    ByteBuffer data = Bytes({0x20, 0x00, 0x00, 0x00, 0x00, 0x01,
                             0x40, 0x05, 0x02, 0xAA, 0xBB});

    auto entries = ScanTlvEntries(View(data));
    ASSERT_TRUE(entries.HasValue());
    ASSERT_EQ(entries.Value().size(), 2u);

    EXPECT_EQ(entries.Value()[0].tag.wireType, WireType::kFixed32);
    EXPECT_EQ(entries.Value()[0].tag.dataId, 0);
    EXPECT_EQ(entries.Value()[0].offset, 0u);
    EXPECT_EQ(entries.Value()[0].valueSize, 4u);

    EXPECT_EQ(entries.Value()[1].tag.wireType, WireType::kLength8);
    EXPECT_EQ(entries.Value()[1].tag.dataId, 5);
    EXPECT_EQ(entries.Value()[1].offset, 6u);
    EXPECT_EQ(entries.Value()[1].valueSize, 2u);
}

TEST_F(SerializerTest, ScanTlvEntriesErrors)
{
    ByteBuffer complex = Bytes({0x70, 0x01, 0x00});
    EXPECT_TRUE(FailsWith(ScanTlvEntries(View(complex)), SomeIpErrc::kUnsupportedWireType));

    ByteBuffer truncated = Bytes({0x20, 0x00, 0x00});
    EXPECT_TRUE(FailsWith(ScanTlvEntries(View(truncated)), SomeIpErrc::kUnexpectedEndOfInput));
}

/**
 * @test Schemas and policies are shared read-only between threads
 */
TEST_F(SerializerTest, ConcurrentUse)
{
    constexpr int kThreads = 4;
    constexpr int kIterations = 200;
    std::atomic<int> failures{0};
    std::vector<std::thread> workers;

    for (int t = 0; t < kThreads; ++t)
    {
        workers.emplace_back([this, &failures]() {
            for (int i = 0; i < kIterations; ++i)
            {
                auto encoded = Encode(m_value, *m_message, Options::Reference());
                if (!encoded.HasValue())
                {
                    ++failures;
                    continue;
                }
                auto decoded = Decode(View(encoded.Value()), *m_message, Options::Reference());
                if (!decoded.HasValue() || decoded.Value() != m_value)
                {
                    ++failures;
                }
            }
        });
    }

    for (auto& worker : workers)
    {
        worker.join();
    }
    EXPECT_EQ(failures.load(), 0);
}
