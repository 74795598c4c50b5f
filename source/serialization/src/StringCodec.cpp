/**
 * @file        StringCodec.cpp
 * @author      LightAP Development Team
 * @brief       String payload codec implementation
 * @date        2025-12-02
 * @copyright   Copyright (c) 2025
 */

#include "StringCodec.hpp"

namespace lap
{
namespace someip
{
namespace serialization
{
    namespace
    {
        constexpr lap::core::UInt32 kByteOrderMark = 0xFEFF;

        /// Decode UTF-8 into code points, rejecting overlong forms, surrogates and values above U+10FFFF
        bool Utf8ToCodePoints(const lap::core::UInt8* data, lap::core::Size size,
                              lap::core::Vector<lap::core::UInt32>& out) noexcept
        {
            lap::core::Size i = 0;
            while (i < size)
            {
                lap::core::UInt8 lead = data[i];
                lap::core::UInt32 cp = 0;
                lap::core::Size extra = 0;
                lap::core::UInt32 minimum = 0;

                if (lead < 0x80)
                {
                    out.push_back(lead);
                    ++i;
                    continue;
                }
                else if ((lead & 0xE0) == 0xC0)
                {
                    cp = lead & 0x1F;
                    extra = 1;
                    minimum = 0x80;
                }
                else if ((lead & 0xF0) == 0xE0)
                {
                    cp = lead & 0x0F;
                    extra = 2;
                    minimum = 0x800;
                }
                else if ((lead & 0xF8) == 0xF0)
                {
                    cp = lead & 0x07;
                    extra = 3;
                    minimum = 0x10000;
                }
                else
                {
                    return false;
                }

                if (extra > size - i - 1)
                {
                    return false;
                }
                for (lap::core::Size k = 1; k <= extra; ++k)
                {
                    lap::core::UInt8 cont = data[i + k];
                    if ((cont & 0xC0) != 0x80)
                    {
                        return false;
                    }
                    cp = (cp << 6) | (cont & 0x3F);
                }

                if (cp < minimum || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
                {
                    return false;
                }
                out.push_back(cp);
                i += extra + 1;
            }
            return true;
        }

        void AppendUtf8(lap::core::UInt32 cp, String& out)
        {
            if (cp < 0x80)
            {
                out.push_back(static_cast<char>(cp));
            }
            else if (cp < 0x800)
            {
                out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
            else if (cp < 0x10000)
            {
                out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
            else
            {
                out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        void AppendUnit(lap::core::UInt16 unit, ByteOrder order, ByteBuffer& out)
        {
            if (order == ByteOrder::kBigEndian)
            {
                out.push_back(static_cast<lap::core::UInt8>(unit >> 8));
                out.push_back(static_cast<lap::core::UInt8>(unit & 0xFF));
            }
            else
            {
                out.push_back(static_cast<lap::core::UInt8>(unit & 0xFF));
                out.push_back(static_cast<lap::core::UInt8>(unit >> 8));
            }
        }

        lap::core::UInt16 ReadUnit(const lap::core::UInt8* data, ByteOrder order) noexcept
        {
            return order == ByteOrder::kBigEndian
                 ? static_cast<lap::core::UInt16>((data[0] << 8) | data[1])
                 : static_cast<lap::core::UInt16>((data[1] << 8) | data[0]);
        }

        bool IsAscii(const lap::core::UInt8* data, lap::core::Size size) noexcept
        {
            for (lap::core::Size i = 0; i < size; ++i)
            {
                if (data[i] >= 0x80)
                {
                    return false;
                }
            }
            return true;
        }

        Result<void> CheckBounds(const StringBounds& bounds, lap::core::Size size) noexcept
        {
            if (size < bounds.minSize)
            {
                return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kNotEnoughData,
                    static_cast<lap::core::ErrorDomain::SupportDataType>(size)));
            }
            if (size > bounds.maxSize)
            {
                return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kTooMuchData,
                    static_cast<lap::core::ErrorDomain::SupportDataType>(size)));
            }
            return Result<void>::FromValue();
        }

        Result<String> InvalidText(const char* reason) noexcept
        {
            LAP_SOMEIP_LOG_DEBUG << "StringCodec: " << reason;
            return Result<String>::FromError(MakeErrorCode(SomeIpErrc::kInvalidStringEncoding));
        }
    } // namespace

    Result<ByteBuffer> StringCodec::EncodeText(const Options& options, const String& text) noexcept
    {
        const auto* data = reinterpret_cast<const lap::core::UInt8*>(text.data());
        ByteBuffer out;

        if (options.GetStringEncoding() == StringEncoding::kAscii)
        {
            if (!IsAscii(data, text.size()))
            {
                LAP_SOMEIP_LOG_DEBUG << "StringCodec: non-ASCII character in ASCII string";
                return Result<ByteBuffer>::FromError(MakeErrorCode(SomeIpErrc::kInvalidStringEncoding));
            }

            out.insert(out.end(), data, data + text.size());
            if (options.IsStringWithTerminator())
            {
                out.push_back(0x00);
            }
            return Result<ByteBuffer>::FromValue(std::move(out));
        }

        if (options.GetStringEncoding() == StringEncoding::kUtf8)
        {
            lap::core::Vector<lap::core::UInt32> codePoints;
            if (!Utf8ToCodePoints(data, text.size(), codePoints))
            {
                return Result<ByteBuffer>::FromError(MakeErrorCode(SomeIpErrc::kInvalidStringEncoding));
            }

            if (options.IsStringWithBom())
            {
                out.push_back(0xEF);
                out.push_back(0xBB);
                out.push_back(0xBF);
            }
            out.insert(out.end(), data, data + text.size());
            if (options.IsStringWithTerminator())
            {
                out.push_back(0x00);
            }
            return Result<ByteBuffer>::FromValue(std::move(out));
        }

        ByteOrder unitOrder = options.GetStringEncoding() == StringEncoding::kUtf16BE
                            ? ByteOrder::kBigEndian : ByteOrder::kLittleEndian;

        lap::core::Vector<lap::core::UInt32> codePoints;
        if (!Utf8ToCodePoints(data, text.size(), codePoints))
        {
            return Result<ByteBuffer>::FromError(MakeErrorCode(SomeIpErrc::kInvalidStringEncoding));
        }

        if (options.IsStringWithBom())
        {
            AppendUnit(static_cast<lap::core::UInt16>(kByteOrderMark), unitOrder, out);
        }
        for (auto cp : codePoints)
        {
            if (cp >= 0x10000)
            {
                lap::core::UInt32 v = cp - 0x10000;
                AppendUnit(static_cast<lap::core::UInt16>(0xD800 | (v >> 10)), unitOrder, out);
                AppendUnit(static_cast<lap::core::UInt16>(0xDC00 | (v & 0x3FF)), unitOrder, out);
            }
            else
            {
                AppendUnit(static_cast<lap::core::UInt16>(cp), unitOrder, out);
            }
        }
        if (options.IsStringWithTerminator())
        {
            AppendUnit(0, unitOrder, out);
        }
        return Result<ByteBuffer>::FromValue(std::move(out));
    }

    Result<String> StringCodec::DecodeText(const Options& options, ByteView bytes) noexcept
    {
        const lap::core::UInt8* data = bytes.data();
        lap::core::Size size = bytes.size();

        if (options.GetStringEncoding() == StringEncoding::kAscii)
        {
            if (options.IsStringWithTerminator())
            {
                if (size == 0 || data[size - 1] != 0x00)
                {
                    return InvalidText("missing terminator");
                }
                --size;
            }
            if (!IsAscii(data, size))
            {
                return InvalidText("non-ASCII byte in ASCII string");
            }
            return Result<String>::FromValue(String(reinterpret_cast<const char*>(data), size));
        }

        if (options.GetStringEncoding() == StringEncoding::kUtf8)
        {
            if (options.IsStringWithBom())
            {
                if (size < 3 || data[0] != 0xEF || data[1] != 0xBB || data[2] != 0xBF)
                {
                    return InvalidText("missing UTF-8 byte order mark");
                }
                data += 3;
                size -= 3;
            }
            if (options.IsStringWithTerminator())
            {
                if (size == 0 || data[size - 1] != 0x00)
                {
                    return InvalidText("missing terminator");
                }
                --size;
            }

            lap::core::Vector<lap::core::UInt32> codePoints;
            if (!Utf8ToCodePoints(data, size, codePoints))
            {
                return InvalidText("malformed UTF-8");
            }
            return Result<String>::FromValue(String(reinterpret_cast<const char*>(data), size));
        }

        ByteOrder unitOrder = options.GetStringEncoding() == StringEncoding::kUtf16BE
                            ? ByteOrder::kBigEndian : ByteOrder::kLittleEndian;

        if (size % 2 != 0)
        {
            return InvalidText("odd UTF-16 byte length");
        }
        if (options.IsStringWithBom())
        {
            if (size < 2 || ReadUnit(data, unitOrder) != kByteOrderMark)
            {
                return InvalidText("missing or foreign UTF-16 byte order mark");
            }
            data += 2;
            size -= 2;
        }
        if (options.IsStringWithTerminator())
        {
            if (size < 2 || ReadUnit(data + size - 2, unitOrder) != 0)
            {
                return InvalidText("missing terminator");
            }
            size -= 2;
        }

        String text;
        for (lap::core::Size i = 0; i < size; i += 2)
        {
            lap::core::UInt32 unit = ReadUnit(data + i, unitOrder);
            if (unit >= 0xD800 && unit <= 0xDBFF)
            {
                if (i + 2 >= size)
                {
                    return InvalidText("unpaired high surrogate");
                }
                lap::core::UInt32 low = ReadUnit(data + i + 2, unitOrder);
                if (low < 0xDC00 || low > 0xDFFF)
                {
                    return InvalidText("unpaired high surrogate");
                }
                AppendUtf8(0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00), text);
                i += 2;
            }
            else if (unit >= 0xDC00 && unit <= 0xDFFF)
            {
                return InvalidText("unpaired low surrogate");
            }
            else
            {
                AppendUtf8(unit, text);
            }
        }
        return Result<String>::FromValue(std::move(text));
    }

    Result<void> StringCodec::Encode(EncodeContext& context, const SchemaType& type, const Value& value) noexcept
    {
        if (value.GetKind() != ValueKind::kString)
        {
            return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kValueSchemaMismatch));
        }

        auto bytes = EncodeText(context.GetOptions(), value.GetText());
        if (!bytes.HasValue())
        {
            return Result<void>::FromError(bytes.Error());
        }

        auto bounds = CheckBounds(type.GetStringBounds(), bytes.Value().size());
        if (!bounds.HasValue())
        {
            return bounds;
        }

        context.GetWriter().WriteBytes(bytes.Value().data(), bytes.Value().size());
        return Result<void>::FromValue();
    }

    Result<Value> StringCodec::Decode(DecodeContext& context, const SchemaType& type, bool bounded) noexcept
    {
        WireReader& reader = context.GetReader();
        const StringBounds& limits = type.GetStringBounds();
        const TooMuchDataAction action = context.GetOptions().GetTooMuchDataAction();
        lap::core::Size size = bounded ? reader.Remaining() : limits.minSize;
        lap::core::Size excess = 0;

        if (size > limits.maxSize && action != TooMuchDataAction::kFail)
        {
            LAP_SOMEIP_LOG_DEBUG << "StringCodec: " << size << " bytes, maximum " << limits.maxSize
                                 << ", action " << ToString(action);
            if (action == TooMuchDataAction::kDiscard)
            {
                excess = size - limits.maxSize;
                size = limits.maxSize;
            }
        }
        else
        {
            auto bounds = CheckBounds(limits, size);
            if (!bounds.HasValue())
            {
                return Result<Value>::FromError(bounds.Error());
            }
        }

        auto bytes = reader.ReadBytes(size);
        if (!bytes.HasValue())
        {
            return Result<Value>::FromError(bytes.Error());
        }

        auto skipped = reader.Skip(excess);
        if (!skipped.HasValue())
        {
            return Result<Value>::FromError(skipped.Error());
        }

        auto text = DecodeText(context.GetOptions(), bytes.Value());
        if (!text.HasValue())
        {
            return Result<Value>::FromError(text.Error());
        }
        return Result<Value>::FromValue(Value::MakeString(text.Value()));
    }

} // namespace serialization
} // namespace someip
} // namespace lap
