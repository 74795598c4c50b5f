/**
 * @file        PrimitiveCodec.cpp
 * @author      LightAP Development Team
 * @brief       Fixed-width primitive codec implementation
 * @date        2025-12-02
 * @copyright   Copyright (c) 2025
 */

#include "PrimitiveCodec.hpp"

namespace lap
{
namespace someip
{
namespace serialization
{
    void PrimitiveCodec::EncodeBits(EncodeContext& context, PrimitiveKind kind, lap::core::UInt64 bits) noexcept
    {
        WireWriter& writer = context.GetWriter();
        ByteOrder order = context.GetOptions().GetByteOrder();

        switch (SizeOf(kind))
        {
            case 1:
                writer.WriteByte(static_cast<lap::core::UInt8>(bits));
                break;
            case 2:
                writer.WriteInteger(static_cast<lap::core::UInt16>(bits), order);
                break;
            case 4:
                writer.WriteInteger(static_cast<lap::core::UInt32>(bits), order);
                break;
            default:
                writer.WriteInteger(bits, order);
                break;
        }
    }

    Result<lap::core::UInt64> PrimitiveCodec::DecodeBits(DecodeContext& context, PrimitiveKind kind) noexcept
    {
        WireReader& reader = context.GetReader();
        ByteOrder order = context.GetOptions().GetByteOrder();

        if (SizeOf(kind) == 8)
        {
            return reader.ReadInteger<lap::core::UInt64>(order);
        }
        return reader.ReadUnsigned(static_cast<lap::core::UInt8>(SizeOf(kind)), order);
    }

    Result<void> PrimitiveCodec::Encode(EncodeContext& context, PrimitiveKind kind, const Value& value) noexcept
    {
        if (value.GetKind() != ValueKind::kPrimitive || value.GetPrimitiveKind() != kind)
        {
            LAP_SOMEIP_LOG_DEBUG << "PrimitiveCodec: expected " << ToString(kind);
            return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kValueSchemaMismatch));
        }

        EncodeBits(context, kind, value.GetBits());
        return Result<void>::FromValue();
    }

    Result<Value> PrimitiveCodec::Decode(DecodeContext& context, PrimitiveKind kind) noexcept
    {
        lap::core::Size offset = context.GetReader().Position();
        auto bits = DecodeBits(context, kind);
        if (!bits.HasValue())
        {
            return Result<Value>::FromError(bits.Error());
        }

        if (kind == PrimitiveKind::kBool && bits.Value() > 1)
        {
            LAP_SOMEIP_LOG_DEBUG << "PrimitiveCodec: invalid boolean " << bits.Value() << " at offset " << offset;
            return Result<Value>::FromError(MakeErrorCode(SomeIpErrc::kInvalidBooleanValue,
                static_cast<lap::core::ErrorDomain::SupportDataType>(offset)));
        }

        return Result<Value>::FromValue(Value::MakePrimitive(kind, bits.Value()));
    }

} // namespace serialization
} // namespace someip
} // namespace lap
