/**
 * @file        ValueCodec.cpp
 * @author      LightAP Development Team
 * @brief       Type dispatch and length field framing implementation
 * @date        2025-12-02
 * @copyright   Copyright (c) 2025
 */

#include "ValueCodec.hpp"
#include "PrimitiveCodec.hpp"
#include "StringCodec.hpp"
#include "SequenceCodec.hpp"
#include "StructEngine.hpp"
#include "UnionCodec.hpp"

namespace lap
{
namespace someip
{
namespace serialization
{
    namespace
    {
        bool IsComposite(const SchemaType& type) noexcept
        {
            return type.GetKind() == TypeKind::kSequence ||
                   type.GetKind() == TypeKind::kStruct ||
                   type.GetKind() == TypeKind::kUnion;
        }
    } // namespace

    // ========================================================================
    // Encode
    // ========================================================================

    Result<void> ValueCodec::Encode(EncodeContext& context,
                                    const SchemaType& type,
                                    const Value& value,
                                    const Placement& placement) noexcept
    {
        auto width = ResolveLengthFieldWidth(type, placement, context.GetOptions());
        if (!width.HasValue())
        {
            return Result<void>::FromError(width.Error());
        }
        return EncodeFramed(context, type, value, width.Value());
    }

    Result<void> ValueCodec::EncodeFramed(EncodeContext& context,
                                          const SchemaType& type,
                                          const Value& value,
                                          lap::core::UInt8 width) noexcept
    {
        if (width == 0)
        {
            return EncodeBody(context, type, value, false);
        }

        WireWriter& writer = context.GetWriter();
        lap::core::Size offset = writer.ReserveLength(width);

        auto body = EncodeBody(context, type, value, true);
        if (!body.HasValue())
        {
            return body;
        }
        return writer.PatchLength(offset, width);
    }

    Result<void> ValueCodec::EncodeBody(EncodeContext& context,
                                        const SchemaType& type,
                                        const Value& value,
                                        bool bounded) noexcept
    {
        DepthGuard<EncodeContext> guard(context);
        if (IsComposite(type) && guard.Exceeded())
        {
            LAP_SOMEIP_LOG_DEBUG << "ValueCodec: nesting exceeds " << context.GetOptions().GetMaxDepth()
                                 << " at " << type.GetName().c_str();
            return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kSchemaTooDeep, context.GetDepth()));
        }

        switch (type.GetKind())
        {
            case TypeKind::kPrimitive:
                return PrimitiveCodec::Encode(context, type.GetPrimitiveKind(), value);
            case TypeKind::kString:
                return StringCodec::Encode(context, type, value);
            case TypeKind::kSequence:
                return SequenceCodec::Encode(context, type, value, bounded);
            case TypeKind::kStruct:
                return StructEngine::Encode(context, type, value);
            case TypeKind::kUnion:
                return UnionCodec::Encode(context, type, value);
        }
        return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kValueSchemaMismatch));
    }

    // ========================================================================
    // Decode
    // ========================================================================

    Result<Value> ValueCodec::Decode(DecodeContext& context,
                                     const SchemaType& type,
                                     const Placement& placement) noexcept
    {
        auto width = ResolveLengthFieldWidth(type, placement, context.GetOptions());
        if (!width.HasValue())
        {
            return Result<Value>::FromError(width.Error());
        }
        return DecodeFramed(context, type, width.Value());
    }

    Result<Value> ValueCodec::DecodeFramed(DecodeContext& context,
                                           const SchemaType& type,
                                           lap::core::UInt8 width) noexcept
    {
        if (width == 0)
        {
            return DecodeBody(context, type, false);
        }

        WireReader& reader = context.GetReader();
        auto length = reader.ReadLength(width);
        if (!length.HasValue())
        {
            return Result<Value>::FromError(length.Error());
        }

        auto window = reader.PushWindow(length.Value());
        if (!window.HasValue())
        {
            LAP_SOMEIP_LOG_DEBUG << "ValueCodec: length " << length.Value() << " of " << type.GetName().c_str()
                                 << " exceeds available input at offset " << reader.Position();
            return Result<Value>::FromError(window.Error());
        }

        auto value = DecodeBody(context, type, true);
        if (!value.HasValue())
        {
            return value;
        }

        auto closed = reader.PopWindow();
        if (!closed.HasValue())
        {
            return Result<Value>::FromError(closed.Error());
        }
        return value;
    }

    Result<Value> ValueCodec::DecodeBody(DecodeContext& context,
                                         const SchemaType& type,
                                         bool bounded) noexcept
    {
        DepthGuard<DecodeContext> guard(context);
        if (IsComposite(type) && guard.Exceeded())
        {
            LAP_SOMEIP_LOG_DEBUG << "ValueCodec: nesting exceeds " << context.GetOptions().GetMaxDepth()
                                 << " at " << type.GetName().c_str();
            return Result<Value>::FromError(MakeErrorCode(SomeIpErrc::kSchemaTooDeep, context.GetDepth()));
        }

        switch (type.GetKind())
        {
            case TypeKind::kPrimitive:
                return PrimitiveCodec::Decode(context, type.GetPrimitiveKind());
            case TypeKind::kString:
                return StringCodec::Decode(context, type, bounded);
            case TypeKind::kSequence:
                return SequenceCodec::Decode(context, type, bounded);
            case TypeKind::kStruct:
                return StructEngine::Decode(context, type);
            case TypeKind::kUnion:
                return UnionCodec::Decode(context, type);
        }
        return Result<Value>::FromError(MakeErrorCode(SomeIpErrc::kValueSchemaMismatch));
    }

} // namespace serialization
} // namespace someip
} // namespace lap
