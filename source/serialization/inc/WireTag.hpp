/**
 * @file        WireTag.hpp
 * @author      LightAP Development Team
 * @brief       TLV tag codec (wire type + 12-bit data id)
 * @date        2025-12-02
 * @details     Tags are two bytes, always transmitted in network byte order regardless
 *              of the payload byte order:
 *              <pre>
 *                15      12 11                     0
 *              +---------+------------------------+
 *              | wiretype|        data id         |
 *              +---------+------------------------+
 *              </pre>
 * @copyright   Copyright (c) 2025
 * @note        AUTOSAR PRS_SOMEIP_00202, PRS_SOMEIP_00203
 * @version     1.0
 */
#ifndef LAP_SOMEIP_WIRE_TAG_HPP
#define LAP_SOMEIP_WIRE_TAG_HPP

#include "SomeIpTypes.hpp"

#include <array>

namespace lap
{
namespace someip
{
namespace serialization
{
    /**
     * @brief Encoded representation class carried in a tag
     */
    enum class WireType : lap::core::UInt8
    {
        kFixed8        = 0,    ///< 1 byte value
        kFixed16       = 1,    ///< 2 byte value
        kFixed32       = 2,    ///< 4 byte value
        kFixed64       = 3,    ///< 8 byte value
        kLength8       = 4,    ///< 1 byte length field followed by the value
        kLength16      = 5,    ///< 2 byte length field followed by the value
        kLength32      = 6,    ///< 4 byte length field followed by the value
        kComplex       = 7     ///< Statically sized value without length field
    };

    /// Largest data id representable in a tag
    constexpr lap::core::UInt16 kMaxDataId = 0x0FFF;

    /// Size of an encoded tag in bytes
    constexpr lap::core::UInt32 kTagSize = 2;

    /**
     * @brief Fixed payload size of a wire type
     * @return 1/2/4/8 for fixed wire types, 0 otherwise
     */
    lap::core::UInt32 FixedSizeOf(WireType wireType) noexcept;

    /**
     * @brief Length field width of a wire type
     * @return 1/2/4 for length-delimited wire types, 0 otherwise
     */
    lap::core::UInt8 LengthFieldWidthOf(WireType wireType) noexcept;

    /**
     * @brief Wire type of a length-delimited value
     * @param width Length field width, 0 selects kComplex
     */
    WireType WireTypeForLengthField(lap::core::UInt8 width) noexcept;

    /**
     * @brief Wire type of a fixed-size value
     * @param size 1, 2, 4 or 8
     */
    WireType WireTypeForFixedSize(lap::core::UInt32 size) noexcept;

    /**
     * @brief Check whether a wire type is followed by a length field
     */
    inline bool IsLengthDelimited(WireType wireType) noexcept
    {
        return wireType == WireType::kLength8 ||
               wireType == WireType::kLength16 ||
               wireType == WireType::kLength32;
    }

    /**
     * @brief Printable wire type, e.g. "fixed32(2)"
     */
    const char* ToString(WireType wireType) noexcept;

    /**
     * @brief Decoded TLV tag
     */
    struct WireTag
    {
        WireType wireType{WireType::kFixed8};
        lap::core::UInt16 dataId{0};

        /**
         * @brief Pack into two network-order bytes
         * @return Tag bytes or kFieldIdOutOfRange when dataId exceeds 12 bits
         */
        static Result<std::array<lap::core::UInt8, kTagSize>> Pack(WireType wireType,
                                                                  lap::core::UInt16 dataId) noexcept;

        /**
         * @brief Unpack two network-order bytes
         * @return Tag or kUnsupportedWireType for the reserved wire types 8..15
         */
        static Result<WireTag> Unpack(lap::core::UInt8 high, lap::core::UInt8 low) noexcept;

        bool operator==(const WireTag& other) const noexcept
        {
            return wireType == other.wireType && dataId == other.dataId;
        }

        bool operator!=(const WireTag& other) const noexcept
        {
            return !(*this == other);
        }
    };

} // namespace serialization
} // namespace someip
} // namespace lap

#endif // LAP_SOMEIP_WIRE_TAG_HPP
