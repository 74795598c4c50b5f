/**
 * @file        WireBuffer.hpp
 * @author      LightAP Development Team
 * @brief       Append-only writer and window-bounded reader over payload bytes
 * @date        2025-12-02
 * @details     The writer appends to a caller-owned buffer and back-patches reserved
 *              length fields. The reader is a forward-only cursor; nested length
 *              windows bound recursive decoding and are never rewound.
 * @copyright   Copyright (c) 2025
 * @version     1.0
 */
#ifndef LAP_SOMEIP_WIRE_BUFFER_HPP
#define LAP_SOMEIP_WIRE_BUFFER_HPP

#include "Options.hpp"

#include <type_traits>
#include <cstring>

namespace lap
{
namespace someip
{
namespace serialization
{
    /**
     * @brief Largest length representable by a length field width
     * @param width 1, 2 or 4
     */
    constexpr lap::core::UInt64 MaxLengthForWidth(lap::core::UInt8 width) noexcept
    {
        return width >= 4 ? 0xFFFFFFFFULL : ((1ULL << (8U * width)) - 1ULL);
    }

    /**
     * @brief Smallest of 1/2/4 bytes able to hold a length
     */
    constexpr lap::core::UInt8 SmallestLengthFieldWidth(lap::core::UInt64 length) noexcept
    {
        return length <= 0xFFU ? 1 : (length <= 0xFFFFU ? 2 : 4);
    }

    /**
     * @brief Append-only payload writer
     */
    class WireWriter final
    {
    public:
        explicit WireWriter(ByteBuffer& buffer) noexcept
            : m_buffer(buffer)
        {}

        WireWriter(const WireWriter&) = delete;
        WireWriter& operator=(const WireWriter&) = delete;

        lap::core::Size Size() const noexcept { return m_buffer.size(); }

        void WriteByte(lap::core::UInt8 value) noexcept
        {
            m_buffer.push_back(value);
        }

        void WriteBytes(const lap::core::UInt8* data, lap::core::Size size) noexcept
        {
            m_buffer.insert(m_buffer.end(), data, data + size);
        }

        void WriteBytes(ByteView data) noexcept
        {
            WriteBytes(data.data(), data.size());
        }

        /**
         * @brief Append an unsigned integer in the given byte order
         */
        template<typename T>
        void WriteInteger(T value, ByteOrder order) noexcept
        {
            static_assert(std::is_unsigned<T>::value, "WriteInteger requires an unsigned type");
            constexpr lap::core::Size size = sizeof(T);

            if (order == ByteOrder::kBigEndian)
            {
                for (lap::core::Size i = 0; i < size; ++i)
                {
                    m_buffer.push_back(static_cast<lap::core::UInt8>(
                        (value >> (8 * (size - 1 - i))) & 0xFF));
                }
            }
            else
            {
                for (lap::core::Size i = 0; i < size; ++i)
                {
                    m_buffer.push_back(static_cast<lap::core::UInt8>(
                        (value >> (8 * i)) & 0xFF));
                }
            }
        }

        /**
         * @brief Append an unsigned value using 1, 2 or 4 bytes
         * @return kValueTooLarge if the value does not fit
         */
        Result<void> WriteUnsigned(lap::core::UInt64 value, lap::core::UInt8 width, ByteOrder order) noexcept;

        /**
         * @brief Append a big-endian length field
         * @return kValueTooLarge if the length does not fit the width
         */
        Result<void> WriteLength(lap::core::UInt64 length, lap::core::UInt8 width) noexcept
        {
            return WriteUnsigned(length, width, ByteOrder::kBigEndian);
        }

        /**
         * @brief Reserve a length field to be patched once the value is written
         * @return Offset of the reserved field
         */
        lap::core::Size ReserveLength(lap::core::UInt8 width) noexcept
        {
            lap::core::Size offset = m_buffer.size();
            m_buffer.insert(m_buffer.end(), width, 0);
            return offset;
        }

        /**
         * @brief Patch a reserved length field with the number of bytes written after it
         * @return kValueTooLarge if the written length does not fit the width
         */
        Result<void> PatchLength(lap::core::Size offset, lap::core::UInt8 width) noexcept;

    private:
        ByteBuffer& m_buffer;
    };

    /**
     * @brief Forward-only payload reader with nested length windows
     * @note Reads beyond the end of the input report kUnexpectedEndOfInput, reads that
     *       stay inside the input but cross the innermost window report kLengthMismatch.
     */
    class WireReader final
    {
    public:
        explicit WireReader(ByteView data) noexcept
            : m_data(data)
            , m_position(0)
        {}

        WireReader(const WireReader&) = delete;
        WireReader& operator=(const WireReader&) = delete;

        lap::core::Size Position() const noexcept { return m_position; }

        /// Bytes left before the innermost window (or the input) ends
        lap::core::Size Remaining() const noexcept { return Limit() - m_position; }

        bool AtEnd() const noexcept { return m_position >= Limit(); }

        /// Number of open windows
        lap::core::Size WindowDepth() const noexcept { return m_limits.size(); }

        Result<lap::core::UInt8> ReadByte() noexcept;

        /**
         * @brief Read an unsigned integer in the given byte order
         */
        template<typename T>
        Result<T> ReadInteger(ByteOrder order) noexcept
        {
            static_assert(std::is_unsigned<T>::value, "ReadInteger requires an unsigned type");
            constexpr lap::core::Size size = sizeof(T);

            auto check = Require(size);
            if (!check.HasValue())
            {
                return Result<T>::FromError(check.Error());
            }

            const lap::core::UInt8* ptr = m_data.data() + m_position;
            T value = 0;
            if (order == ByteOrder::kBigEndian)
            {
                for (lap::core::Size i = 0; i < size; ++i)
                {
                    value = static_cast<T>((value << 8) | ptr[i]);
                }
            }
            else
            {
                for (lap::core::Size i = 0; i < size; ++i)
                {
                    value = static_cast<T>(value | (static_cast<T>(ptr[i]) << (8 * i)));
                }
            }
            m_position += size;
            return Result<T>::FromValue(value);
        }

        /**
         * @brief Read an unsigned value stored in 1, 2 or 4 bytes
         */
        Result<lap::core::UInt64> ReadUnsigned(lap::core::UInt8 width, ByteOrder order) noexcept;

        /**
         * @brief Read a big-endian length field
         */
        Result<lap::core::UInt64> ReadLength(lap::core::UInt8 width) noexcept
        {
            return ReadUnsigned(width, ByteOrder::kBigEndian);
        }

        /**
         * @brief Consume a run of bytes
         * @return View into the input, valid as long as the input
         */
        Result<ByteView> ReadBytes(lap::core::Size size) noexcept;

        Result<void> Skip(lap::core::Size size) noexcept;

        /**
         * @brief Open a window of the next @p length bytes
         */
        Result<void> PushWindow(lap::core::UInt64 length) noexcept;

        /**
         * @brief Close the innermost window
         * @return kLengthMismatch unless the window was consumed exactly
         */
        Result<void> PopWindow() noexcept;

    private:
        lap::core::Size Limit() const noexcept
        {
            return m_limits.empty() ? m_data.size() : m_limits.back();
        }

        Result<void> Require(lap::core::Size size) const noexcept;

        ByteView m_data;
        lap::core::Size m_position;
        lap::core::Vector<lap::core::Size> m_limits;
    };

} // namespace serialization
} // namespace someip
} // namespace lap

#endif // LAP_SOMEIP_WIRE_BUFFER_HPP
