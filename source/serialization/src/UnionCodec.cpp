/**
 * @file        UnionCodec.cpp
 * @author      LightAP Development Team
 * @brief       Union / enumeration codec implementation
 * @date        2025-12-02
 * @copyright   Copyright (c) 2025
 */

#include "UnionCodec.hpp"
#include "PrimitiveCodec.hpp"
#include "ValueCodec.hpp"

namespace lap
{
namespace someip
{
namespace serialization
{
    Result<void> UnionCodec::Encode(EncodeContext& context, const SchemaType& type, const Value& value) noexcept
    {
        if (value.GetKind() != ValueKind::kUnion)
        {
            return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kValueSchemaMismatch));
        }

        const UnionVariant* variant = type.FindVariantByName(value.GetVariantName());
        if (variant == nullptr)
        {
            LAP_SOMEIP_LOG_DEBUG << "UnionCodec: " << type.GetName().c_str() << " has no variant '"
                                 << value.GetVariantName().c_str() << "'";
            return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kUnknownDiscriminant));
        }

        if (static_cast<bool>(variant->payload) != value.HasPayload())
        {
            return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kValueSchemaMismatch, variant->discriminant));
        }

        if (type.IsTreatAs())
        {
            PrimitiveCodec::EncodeBits(context, type.GetPrimitiveKind(),
                                       static_cast<lap::core::UInt64>(variant->treatAsValue.value()));
            return Result<void>::FromValue();
        }

        auto selector = context.GetWriter().WriteUnsigned(variant->discriminant,
                                                          context.GetOptions().GetUnionSelectorWidth(),
                                                          context.GetOptions().GetByteOrder());
        if (!selector.HasValue())
        {
            return selector;
        }

        if (!variant->payload)
        {
            return Result<void>::FromValue();
        }
        return ValueCodec::Encode(context, *variant->payload, value.GetPayload(), Placement::Nested(false));
    }

    Result<Value> UnionCodec::Decode(DecodeContext& context, const SchemaType& type) noexcept
    {
        WireReader& reader = context.GetReader();
        lap::core::Size offset = reader.Position();

        if (type.IsTreatAs())
        {
            auto bits = PrimitiveCodec::DecodeBits(context, type.GetPrimitiveKind());
            if (!bits.HasValue())
            {
                return Result<Value>::FromError(bits.Error());
            }

            lap::core::Int64 encoded = Value::MakePrimitive(type.GetPrimitiveKind(), bits.Value()).AsInt64();
            const UnionVariant* variant = type.FindVariantByTreatAsValue(encoded);
            if (variant == nullptr)
            {
                LAP_SOMEIP_LOG_DEBUG << "UnionCodec: " << type.GetName().c_str() << " has no variant encoded as "
                                     << encoded << " at offset " << offset;
                return Result<Value>::FromError(MakeErrorCode(SomeIpErrc::kUnknownTreatAsValue,
                    static_cast<lap::core::ErrorDomain::SupportDataType>(offset)));
            }
            return Result<Value>::FromValue(Value::MakeUnion(variant->name));
        }

        auto selector = reader.ReadUnsigned(context.GetOptions().GetUnionSelectorWidth(),
                                            context.GetOptions().GetByteOrder());
        if (!selector.HasValue())
        {
            return Result<Value>::FromError(selector.Error());
        }

        const UnionVariant* variant = type.FindVariantByDiscriminant(static_cast<lap::core::UInt32>(selector.Value()));
        if (variant == nullptr)
        {
            LAP_SOMEIP_LOG_DEBUG << "UnionCodec: " << type.GetName().c_str() << " has no discriminant "
                                 << selector.Value() << " at offset " << offset;
            return Result<Value>::FromError(MakeErrorCode(SomeIpErrc::kUnknownDiscriminant,
                static_cast<lap::core::ErrorDomain::SupportDataType>(offset)));
        }

        if (!variant->payload)
        {
            return Result<Value>::FromValue(Value::MakeUnion(variant->name));
        }

        auto payload = ValueCodec::Decode(context, *variant->payload, Placement::Nested(false));
        if (!payload.HasValue())
        {
            return payload;
        }
        return Result<Value>::FromValue(Value::MakeUnion(variant->name, payload.Value()));
    }

} // namespace serialization
} // namespace someip
} // namespace lap
