/**
 * @file        WireTag.cpp
 * @author      LightAP Development Team
 * @brief       TLV tag codec implementation
 * @date        2025-12-02
 * @copyright   Copyright (c) 2025
 */

#include "WireTag.hpp"

namespace lap
{
namespace someip
{
namespace serialization
{
    lap::core::UInt32 FixedSizeOf(WireType wireType) noexcept
    {
        switch (wireType)
        {
            case WireType::kFixed8:
                return 1;
            case WireType::kFixed16:
                return 2;
            case WireType::kFixed32:
                return 4;
            case WireType::kFixed64:
                return 8;
            default:
                return 0;
        }
    }

    lap::core::UInt8 LengthFieldWidthOf(WireType wireType) noexcept
    {
        switch (wireType)
        {
            case WireType::kLength8:
                return 1;
            case WireType::kLength16:
                return 2;
            case WireType::kLength32:
                return 4;
            default:
                return 0;
        }
    }

    WireType WireTypeForLengthField(lap::core::UInt8 width) noexcept
    {
        switch (width)
        {
            case 1:
                return WireType::kLength8;
            case 2:
                return WireType::kLength16;
            case 4:
                return WireType::kLength32;
            default:
                return WireType::kComplex;
        }
    }

    WireType WireTypeForFixedSize(lap::core::UInt32 size) noexcept
    {
        switch (size)
        {
            case 1:
                return WireType::kFixed8;
            case 2:
                return WireType::kFixed16;
            case 4:
                return WireType::kFixed32;
            default:
                return WireType::kFixed64;
        }
    }

    const char* ToString(WireType wireType) noexcept
    {
        switch (wireType)
        {
            case WireType::kFixed8:
                return "fixed8(0)";
            case WireType::kFixed16:
                return "fixed16(1)";
            case WireType::kFixed32:
                return "fixed32(2)";
            case WireType::kFixed64:
                return "fixed64(3)";
            case WireType::kLength8:
                return "length8(4)";
            case WireType::kLength16:
                return "length16(5)";
            case WireType::kLength32:
                return "length32(6)";
            case WireType::kComplex:
                return "complex(7)";
        }
        return "reserved";
    }

    Result<std::array<lap::core::UInt8, kTagSize>> WireTag::Pack(WireType wireType,
                                                                lap::core::UInt16 dataId) noexcept
    {
        if (dataId > kMaxDataId)
        {
            return Result<std::array<lap::core::UInt8, kTagSize>>::FromError(
                MakeErrorCode(SomeIpErrc::kFieldIdOutOfRange, dataId));
        }

        lap::core::UInt16 raw = static_cast<lap::core::UInt16>(
            (static_cast<lap::core::UInt16>(wireType) << 12) | dataId);

        std::array<lap::core::UInt8, kTagSize> bytes{{
            static_cast<lap::core::UInt8>((raw >> 8) & 0xFF),
            static_cast<lap::core::UInt8>(raw & 0xFF)
        }};
        return Result<std::array<lap::core::UInt8, kTagSize>>::FromValue(bytes);
    }

    Result<WireTag> WireTag::Unpack(lap::core::UInt8 high, lap::core::UInt8 low) noexcept
    {
        lap::core::UInt8 wireBits = static_cast<lap::core::UInt8>((high >> 4) & 0x0F);
        if (wireBits > static_cast<lap::core::UInt8>(WireType::kComplex))
        {
            return Result<WireTag>::FromError(MakeErrorCode(SomeIpErrc::kUnsupportedWireType, wireBits));
        }

        WireTag tag;
        tag.wireType = static_cast<WireType>(wireBits);
        tag.dataId = static_cast<lap::core::UInt16>(((high & 0x0F) << 8) | low);
        return Result<WireTag>::FromValue(tag);
    }

} // namespace serialization
} // namespace someip
} // namespace lap
