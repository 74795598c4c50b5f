/**
 * @file        WireBuffer.cpp
 * @author      LightAP Development Team
 * @brief       Payload writer/reader implementation
 * @date        2025-12-02
 * @copyright   Copyright (c) 2025
 */

#include "WireBuffer.hpp"

namespace lap
{
namespace someip
{
namespace serialization
{
    // ========================================================================
    // WireWriter
    // ========================================================================

    Result<void> WireWriter::WriteUnsigned(lap::core::UInt64 value, lap::core::UInt8 width, ByteOrder order) noexcept
    {
        if (value > MaxLengthForWidth(width))
        {
            return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kValueTooLarge,
                static_cast<lap::core::ErrorDomain::SupportDataType>(value)));
        }

        switch (width)
        {
            case 1:
                WriteByte(static_cast<lap::core::UInt8>(value));
                break;
            case 2:
                WriteInteger(static_cast<lap::core::UInt16>(value), order);
                break;
            case 4:
                WriteInteger(static_cast<lap::core::UInt32>(value), order);
                break;
            default:
                return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kInvalidLengthFieldWidth, width));
        }
        return Result<void>::FromValue();
    }

    Result<void> WireWriter::PatchLength(lap::core::Size offset, lap::core::UInt8 width) noexcept
    {
        lap::core::UInt64 length = m_buffer.size() - offset - width;
        if (length > MaxLengthForWidth(width))
        {
            LAP_SOMEIP_LOG_DEBUG << "WireWriter: length " << length << " exceeds "
                                 << static_cast<lap::core::UInt32>(width) << "-byte length field";
            return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kValueTooLarge,
                static_cast<lap::core::ErrorDomain::SupportDataType>(length)));
        }

        // Length fields are network byte order
        for (lap::core::UInt8 i = 0; i < width; ++i)
        {
            m_buffer[offset + i] = static_cast<lap::core::UInt8>((length >> (8 * (width - 1 - i))) & 0xFF);
        }
        return Result<void>::FromValue();
    }

    // ========================================================================
    // WireReader
    // ========================================================================

    Result<void> WireReader::Require(lap::core::Size size) const noexcept
    {
        if (size <= Limit() - m_position)
        {
            return Result<void>::FromValue();
        }

        auto offset = static_cast<lap::core::ErrorDomain::SupportDataType>(m_position);
        if (size > m_data.size() - m_position)
        {
            return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kUnexpectedEndOfInput, offset));
        }
        return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kLengthMismatch, offset));
    }

    Result<lap::core::UInt8> WireReader::ReadByte() noexcept
    {
        auto check = Require(1);
        if (!check.HasValue())
        {
            return Result<lap::core::UInt8>::FromError(check.Error());
        }
        return Result<lap::core::UInt8>::FromValue(m_data.data()[m_position++]);
    }

    Result<lap::core::UInt64> WireReader::ReadUnsigned(lap::core::UInt8 width, ByteOrder order) noexcept
    {
        switch (width)
        {
            case 1:
            {
                auto value = ReadByte();
                if (!value.HasValue())
                {
                    return Result<lap::core::UInt64>::FromError(value.Error());
                }
                return Result<lap::core::UInt64>::FromValue(value.Value());
            }
            case 2:
            {
                auto value = ReadInteger<lap::core::UInt16>(order);
                if (!value.HasValue())
                {
                    return Result<lap::core::UInt64>::FromError(value.Error());
                }
                return Result<lap::core::UInt64>::FromValue(value.Value());
            }
            case 4:
            {
                auto value = ReadInteger<lap::core::UInt32>(order);
                if (!value.HasValue())
                {
                    return Result<lap::core::UInt64>::FromError(value.Error());
                }
                return Result<lap::core::UInt64>::FromValue(value.Value());
            }
            default:
                return Result<lap::core::UInt64>::FromError(
                    MakeErrorCode(SomeIpErrc::kInvalidLengthFieldWidth, width));
        }
    }

    Result<ByteView> WireReader::ReadBytes(lap::core::Size size) noexcept
    {
        auto check = Require(size);
        if (!check.HasValue())
        {
            return Result<ByteView>::FromError(check.Error());
        }

        ByteView view(m_data.data() + m_position, size);
        m_position += size;
        return Result<ByteView>::FromValue(view);
    }

    Result<void> WireReader::Skip(lap::core::Size size) noexcept
    {
        auto check = Require(size);
        if (!check.HasValue())
        {
            return check;
        }
        m_position += size;
        return Result<void>::FromValue();
    }

    Result<void> WireReader::PushWindow(lap::core::UInt64 length) noexcept
    {
        if (length > m_data.size() - m_position)
        {
            return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kUnexpectedEndOfInput,
                static_cast<lap::core::ErrorDomain::SupportDataType>(m_position)));
        }
        if (length > Limit() - m_position)
        {
            return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kLengthMismatch,
                static_cast<lap::core::ErrorDomain::SupportDataType>(m_position)));
        }

        m_limits.push_back(m_position + static_cast<lap::core::Size>(length));
        return Result<void>::FromValue();
    }

    Result<void> WireReader::PopWindow() noexcept
    {
        if (m_limits.empty())
        {
            return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kLengthMismatch,
                static_cast<lap::core::ErrorDomain::SupportDataType>(m_position)));
        }

        lap::core::Size limit = m_limits.back();
        m_limits.pop_back();
        if (m_position != limit)
        {
            LAP_SOMEIP_LOG_DEBUG << "WireReader: window left " << (limit - m_position) << " bytes unconsumed";
            return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kLengthMismatch,
                static_cast<lap::core::ErrorDomain::SupportDataType>(m_position)));
        }
        return Result<void>::FromValue();
    }

} // namespace serialization
} // namespace someip
} // namespace lap
