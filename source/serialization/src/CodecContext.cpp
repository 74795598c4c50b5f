/**
 * @file        CodecContext.cpp
 * @author      LightAP Development Team
 * @brief       Length field and wire type resolution
 * @date        2025-12-02
 * @copyright   Copyright (c) 2025
 */

#include "CodecContext.hpp"

namespace lap
{
namespace someip
{
namespace serialization
{
    LengthFieldCategory CategoryOf(TypeKind kind) noexcept
    {
        switch (kind)
        {
            case TypeKind::kString:
                return LengthFieldCategory::kString;
            case TypeKind::kStruct:
                return LengthFieldCategory::kStruct;
            case TypeKind::kUnion:
                return LengthFieldCategory::kUnion;
            default:
                return LengthFieldCategory::kArray;
        }
    }

    Result<lap::core::UInt8> ResolveLengthFieldWidth(const SchemaType& type,
                                                     const Placement& placement,
                                                     const Options& options) noexcept
    {
        if (type.IsFixedSize())
        {
            return Result<lap::core::UInt8>::FromValue(0);
        }

        Optional<lap::core::UInt8> overridden = placement.fieldWidth.has_value()
                                              ? placement.fieldWidth
                                              : type.GetLengthFieldWidth();
        if (overridden.has_value())
        {
            return Result<lap::core::UInt8>::FromValue(overridden.value());
        }

        switch (type.GetKind())
        {
            case TypeKind::kStruct:
                if (placement.topLevel || (!placement.inTlv && !type.IsTlv()))
                {
                    return Result<lap::core::UInt8>::FromValue(0);
                }
                break;
            case TypeKind::kUnion:
                if (placement.topLevel || !placement.inTlv)
                {
                    return Result<lap::core::UInt8>::FromValue(0);
                }
                break;
            default:
                break;
        }

        lap::core::UInt8 width = options.GetLengthFieldWidth(CategoryOf(type.GetKind()));
        if (width == 0 && !type.IsStaticallySized())
        {
            LAP_SOMEIP_LOG_DEBUG << "Codec: " << type.GetName().c_str()
                                 << " is dynamically sized but the default length field width is 0";
            return Result<lap::core::UInt8>::FromError(MakeErrorCode(SomeIpErrc::kInvalidLengthFieldWidth, 0));
        }
        return Result<lap::core::UInt8>::FromValue(width);
    }

    Result<WireType> ResolveWireType(const SchemaType& type,
                                     const Placement& placement,
                                     const Options& options) noexcept
    {
        if (type.IsFixedSize())
        {
            return Result<WireType>::FromValue(WireTypeForFixedSize(SizeOf(type.GetPrimitiveKind())));
        }

        auto width = ResolveLengthFieldWidth(type, placement, options);
        if (!width.HasValue())
        {
            return Result<WireType>::FromError(width.Error());
        }
        return Result<WireType>::FromValue(WireTypeForLengthField(width.Value()));
    }

} // namespace serialization
} // namespace someip
} // namespace lap
