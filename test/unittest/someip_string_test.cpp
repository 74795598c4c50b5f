/**
 * @file        someip_string_test.cpp
 * @author      LightAP Development Team
 * @brief       Unit tests for string encoding
 * @date        2025-12-02
 * @copyright   Copyright (c) 2025
 */

#include "someip_test_helpers.hpp"

using namespace lap::someip;
using namespace lap::someip::serialization;
using namespace lap::someip::test;

class StringCodecTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_text = StringType();
    }

    Options Utf16(StringEncoding encoding, bool bom, bool terminator)
    {
        OptionsConfig config;
        config.stringEncoding = encoding;
        config.stringWithBom = bom;
        config.stringWithTerminator = terminator;
        return MakeOptions(config);
    }

    Options Ascii(bool terminator)
    {
        OptionsConfig config;
        config.stringEncoding = StringEncoding::kAscii;
        config.stringWithTerminator = terminator;
        return MakeOptions(config);
    }

    Options OnTooMuchData(TooMuchDataAction action, bool terminator = false)
    {
        OptionsConfig config;
        config.tooMuchData = action;
        config.stringWithTerminator = terminator;
        return MakeOptions(config);
    }

    SchemaTypePtr m_text;
};

TEST_F(StringCodecTest, ReferenceUtf8)
{
    auto encoded = Encode(Value::MakeString("abc"), *m_text, Options::Reference());
    ASSERT_TRUE(encoded.HasValue());
    EXPECT_EQ(encoded.Value(), Bytes({0x00, 0x00, 0x00, 0x03, 'a', 'b', 'c'}));

    auto decoded = Decode(View(encoded.Value()), *m_text, Options::Reference());
    ASSERT_TRUE(decoded.HasValue());
    EXPECT_STREQ(decoded.Value().GetText().c_str(), "abc");
}

TEST_F(StringCodecTest, EmptyString)
{
    auto encoded = Encode(Value::MakeString(""), *m_text, Options::Reference());
    ASSERT_TRUE(encoded.HasValue());
    EXPECT_EQ(encoded.Value(), Bytes({0x00, 0x00, 0x00, 0x00}));

    auto decoded = Decode(View(encoded.Value()), *m_text, Options::Reference());
    ASSERT_TRUE(decoded.HasValue());
    EXPECT_TRUE(decoded.Value().GetText().empty());
}

/**
 * @test BOM and terminator are counted by the length field
 */
TEST_F(StringCodecTest, AutosarUtf8)
{
    auto encoded = Encode(Value::MakeString("ab"), *m_text, Options::Autosar());
    ASSERT_TRUE(encoded.HasValue());
    EXPECT_EQ(encoded.Value(), Bytes({0x00, 0x00, 0x00, 0x06, 0xEF, 0xBB, 0xBF, 'a', 'b', 0x00}));

    auto decoded = Decode(View(encoded.Value()), *m_text, Options::Autosar());
    ASSERT_TRUE(decoded.HasValue());
    EXPECT_STREQ(decoded.Value().GetText().c_str(), "ab");
}

TEST_F(StringCodecTest, AutosarMissingTerminator)
{
    ByteBuffer data = Bytes({0x00, 0x00, 0x00, 0x05, 0xEF, 0xBB, 0xBF, 'a', 'b'});
    EXPECT_TRUE(FailsWith(Decode(View(data), *m_text, Options::Autosar()), SomeIpErrc::kInvalidStringEncoding));
}

TEST_F(StringCodecTest, AutosarMissingBom)
{
    ByteBuffer data = Bytes({0x00, 0x00, 0x00, 0x03, 'a', 'b', 0x00});
    EXPECT_TRUE(FailsWith(Decode(View(data), *m_text, Options::Autosar()), SomeIpErrc::kInvalidStringEncoding));
}

TEST_F(StringCodecTest, Utf16BigEndian)
{
    Options options = Utf16(StringEncoding::kUtf16BE, true, true);

    auto encoded = Encode(Value::MakeString("A"), *m_text, options);
    ASSERT_TRUE(encoded.HasValue());
    EXPECT_EQ(encoded.Value(), Bytes({0x00, 0x00, 0x00, 0x06, 0xFE, 0xFF, 0x00, 0x41, 0x00, 0x00}));

    auto decoded = Decode(View(encoded.Value()), *m_text, options);
    ASSERT_TRUE(decoded.HasValue());
    EXPECT_STREQ(decoded.Value().GetText().c_str(), "A");
}

/**
 * @test The BOM follows the code-unit order of the encoding
 */
TEST_F(StringCodecTest, Utf16LittleEndian)
{
    Options options = Utf16(StringEncoding::kUtf16LE, true, false);

    auto encoded = Encode(Value::MakeString("A"), *m_text, options);
    ASSERT_TRUE(encoded.HasValue());
    EXPECT_EQ(encoded.Value(), Bytes({0x00, 0x00, 0x00, 0x04, 0xFF, 0xFE, 0x41, 0x00}));

    // A big-endian BOM is foreign to a little-endian policy
    ByteBuffer foreign = Bytes({0x00, 0x00, 0x00, 0x04, 0xFE, 0xFF, 0x41, 0x00});
    EXPECT_TRUE(FailsWith(Decode(View(foreign), *m_text, options), SomeIpErrc::kInvalidStringEncoding));
}

TEST_F(StringCodecTest, Utf16SurrogatePair)
{
    Options options = Utf16(StringEncoding::kUtf16BE, false, false);
    const String smiley("\xF0\x9F\x98\x80");

    auto encoded = Encode(Value::MakeString(smiley), *m_text, options);
    ASSERT_TRUE(encoded.HasValue());
    EXPECT_EQ(encoded.Value(), Bytes({0x00, 0x00, 0x00, 0x04, 0xD8, 0x3D, 0xDE, 0x00}));

    auto decoded = Decode(View(encoded.Value()), *m_text, options);
    ASSERT_TRUE(decoded.HasValue());
    EXPECT_EQ(decoded.Value().GetText(), smiley);
}

TEST_F(StringCodecTest, Utf16Malformed)
{
    Options options = Utf16(StringEncoding::kUtf16BE, false, false);

    ByteBuffer odd = Bytes({0x00, 0x00, 0x00, 0x03, 0x00, 0x41, 0x00});
    EXPECT_TRUE(FailsWith(Decode(View(odd), *m_text, options), SomeIpErrc::kInvalidStringEncoding));

    ByteBuffer lowFirst = Bytes({0x00, 0x00, 0x00, 0x02, 0xDC, 0x00});
    EXPECT_TRUE(FailsWith(Decode(View(lowFirst), *m_text, options), SomeIpErrc::kInvalidStringEncoding));

    ByteBuffer highAlone = Bytes({0x00, 0x00, 0x00, 0x04, 0xD8, 0x3D, 0x00, 0x41});
    EXPECT_TRUE(FailsWith(Decode(View(highAlone), *m_text, options), SomeIpErrc::kInvalidStringEncoding));
}

TEST_F(StringCodecTest, InvalidUtf8)
{
    // Overlong encoding of NUL
    EXPECT_TRUE(FailsWith(Encode(Value::MakeString("\xC0\x80"), *m_text, Options::Reference()),
                          SomeIpErrc::kInvalidStringEncoding));

    ByteBuffer truncated = Bytes({0x00, 0x00, 0x00, 0x02, 0xE2, 0x82});
    EXPECT_TRUE(FailsWith(Decode(View(truncated), *m_text, Options::Reference()),
                          SomeIpErrc::kInvalidStringEncoding));

    ByteBuffer surrogate = Bytes({0x00, 0x00, 0x00, 0x03, 0xED, 0xA0, 0x80});
    EXPECT_TRUE(FailsWith(Decode(View(surrogate), *m_text, Options::Reference()),
                          SomeIpErrc::kInvalidStringEncoding));
}

TEST_F(StringCodecTest, SizeBounds)
{
    StringBounds bounds;
    bounds.minSize = 2;
    bounds.maxSize = 3;
    auto bounded = StringType(bounds);

    EXPECT_TRUE(FailsWith(Encode(Value::MakeString("a"), *bounded, Options::Reference()),
                          SomeIpErrc::kNotEnoughData));
    EXPECT_TRUE(FailsWith(Encode(Value::MakeString("abcd"), *bounded, Options::Reference()),
                          SomeIpErrc::kTooMuchData));

    ByteBuffer tooLong = Bytes({0x00, 0x00, 0x00, 0x04, 'a', 'b', 'c', 'd'});
    EXPECT_TRUE(FailsWith(Decode(View(tooLong), *bounded, Options::Reference()), SomeIpErrc::kTooMuchData));
}

/**
 * @test A statically sized string without length field has exactly its size
 */
TEST_F(StringCodecTest, StaticStringWithoutLengthField)
{
    StringBounds bounds;
    bounds.minSize = 4;
    bounds.maxSize = 4;
    auto fixedText = StringType(bounds, Optional<lap::core::UInt8>(0));

    auto encoded = Encode(Value::MakeString("abcd"), *fixedText, Options::Reference());
    ASSERT_TRUE(encoded.HasValue());
    EXPECT_EQ(encoded.Value(), Bytes({'a', 'b', 'c', 'd'}));

    auto decoded = Decode(View(encoded.Value()), *fixedText, Options::Reference());
    ASSERT_TRUE(decoded.HasValue());
    EXPECT_STREQ(decoded.Value().GetText().c_str(), "abcd");

    EXPECT_TRUE(FailsWith(Encode(Value::MakeString("abc"), *fixedText, Options::Reference()),
                          SomeIpErrc::kNotEnoughData));
}

TEST_F(StringCodecTest, OneByteLengthField)
{
    auto shortText = StringType(StringBounds(), Optional<lap::core::UInt8>(1));

    auto fits = Encode(Value::MakeString(String(255, 'x')), *shortText, Options::Reference());
    ASSERT_TRUE(fits.HasValue());
    EXPECT_EQ(fits.Value().size(), 256u);
    EXPECT_EQ(fits.Value()[0], 0xFF);

    EXPECT_TRUE(FailsWith(Encode(Value::MakeString(String(256, 'x')), *shortText, Options::Reference()),
                          SomeIpErrc::kValueTooLarge));
}

TEST_F(StringCodecTest, LengthBeyondInput)
{
    ByteBuffer data = Bytes({0x00, 0x00, 0x00, 0x09, 'a'});
    EXPECT_TRUE(FailsWith(Decode(View(data), *m_text, Options::Reference()), SomeIpErrc::kUnexpectedEndOfInput));
}

// ============================================================================
// ASCII
// ============================================================================

TEST_F(StringCodecTest, AsciiTerminated)
{
    Options options = Ascii(true);

    auto encoded = Encode(Value::MakeString("ok"), *m_text, options);
    ASSERT_TRUE(encoded.HasValue());
    EXPECT_EQ(encoded.Value(), Bytes({0x00, 0x00, 0x00, 0x03, 'o', 'k', 0x00}));

    auto decoded = Decode(View(encoded.Value()), *m_text, options);
    ASSERT_TRUE(decoded.HasValue());
    EXPECT_STREQ(decoded.Value().GetText().c_str(), "ok");

    ByteBuffer unterminated = Bytes({0x00, 0x00, 0x00, 0x02, 'o', 'k'});
    EXPECT_TRUE(FailsWith(Decode(View(unterminated), *m_text, options), SomeIpErrc::kInvalidStringEncoding));
}

/**
 * @test Characters above 0x7F are not ASCII, even when valid UTF-8
 */
TEST_F(StringCodecTest, AsciiRejectsWideCharacters)
{
    Options options = Ascii(false);

    EXPECT_TRUE(FailsWith(Encode(Value::MakeString("caf\xC3\xA9"), *m_text, options),
                          SomeIpErrc::kInvalidStringEncoding));

    ByteBuffer data = Bytes({0x00, 0x00, 0x00, 0x02, 'a', 0xC3});
    EXPECT_TRUE(FailsWith(Decode(View(data), *m_text, options), SomeIpErrc::kInvalidStringEncoding));

    auto utf8 = Decode(View(Bytes({0x00, 0x00, 0x00, 0x02, 0xC3, 0xA9})), *m_text, Options::Reference());
    EXPECT_TRUE(utf8.HasValue());
}

// ============================================================================
// Too much data
// ============================================================================

TEST_F(StringCodecTest, TooMuchDataActions)
{
    StringBounds bounds;
    bounds.maxSize = 3;
    auto bounded = StringType(bounds);
    auto holder = Struct("Holder", {Field(0, "text", bounded), Field(1, "n", types::UInt8())}, false);

    ByteBuffer data = Bytes({0x00, 0x00, 0x00, 0x05, 'a', 'b', 'c', 'd', 'e', 0x07});

    EXPECT_TRUE(FailsWith(Decode(View(data), *holder, OnTooMuchData(TooMuchDataAction::kFail)),
                          SomeIpErrc::kTooMuchData));

    auto discarded = Decode(View(data), *holder, OnTooMuchData(TooMuchDataAction::kDiscard));
    ASSERT_TRUE(discarded.HasValue());
    ASSERT_NE(discarded.Value().FindField("text"), nullptr);
    EXPECT_STREQ(discarded.Value().FindField("text")->GetText().c_str(), "abc");
    EXPECT_EQ(*discarded.Value().FindField("n"), Value::MakeUInt8(7));

    auto kept = Decode(View(data), *holder, OnTooMuchData(TooMuchDataAction::kKeep));
    ASSERT_TRUE(kept.HasValue());
    EXPECT_STREQ(kept.Value().FindField("text")->GetText().c_str(), "abcde");
    EXPECT_EQ(*kept.Value().FindField("n"), Value::MakeUInt8(7));

    EXPECT_TRUE(FailsWith(Encode(Value::MakeString("abcde"), *bounded, OnTooMuchData(TooMuchDataAction::kKeep)),
                          SomeIpErrc::kTooMuchData));
}

/**
 * @test Discarding cuts the terminator off an over-long terminated string
 */
TEST_F(StringCodecTest, DiscardCutsTerminator)
{
    StringBounds bounds;
    bounds.maxSize = 3;
    auto bounded = StringType(bounds);

    ByteBuffer data = Bytes({0x00, 0x00, 0x00, 0x04, 'a', 'b', 'c', 0x00});
    EXPECT_TRUE(FailsWith(Decode(View(data), *bounded, OnTooMuchData(TooMuchDataAction::kDiscard, true)),
                          SomeIpErrc::kInvalidStringEncoding));

    ByteBuffer fits = Bytes({0x00, 0x00, 0x00, 0x03, 'a', 'b', 0x00});
    auto decoded = Decode(View(fits), *bounded, OnTooMuchData(TooMuchDataAction::kDiscard, true));
    ASSERT_TRUE(decoded.HasValue());
    EXPECT_STREQ(decoded.Value().GetText().c_str(), "ab");
}
