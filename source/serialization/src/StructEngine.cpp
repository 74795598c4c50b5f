/**
 * @file        StructEngine.cpp
 * @author      LightAP Development Team
 * @brief       Struct codec implementation
 * @date        2025-12-02
 * @copyright   Copyright (c) 2025
 */

#include "StructEngine.hpp"
#include "ValueCodec.hpp"

namespace lap
{
namespace someip
{
namespace serialization
{
    namespace
    {
        Result<void> CheckMembers(const SchemaType& type, const Value& value) noexcept
        {
            if (value.GetKind() != ValueKind::kStruct)
            {
                LAP_SOMEIP_LOG_DEBUG << "StructEngine: " << type.GetName().c_str() << " expects a struct value";
                return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kValueSchemaMismatch));
            }

            for (lap::core::Size i = 0; i < value.GetFieldCount(); ++i)
            {
                if (type.FindFieldByName(value.GetFieldName(i)) == nullptr)
                {
                    LAP_SOMEIP_LOG_DEBUG << "StructEngine: " << type.GetName().c_str()
                                         << " has no member '" << value.GetFieldName(i).c_str() << "'";
                    return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kValueSchemaMismatch));
                }
            }
            return Result<void>::FromValue();
        }

        Result<void> MissingMember(const SchemaType& type, const SchemaField& field) noexcept
        {
            LAP_SOMEIP_LOG_DEBUG << "StructEngine: " << type.GetName().c_str() << " misses mandatory member '"
                                 << field.name.c_str() << "' (id " << field.id << ")";
            return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kMissingMandatoryField, field.id));
        }
    } // namespace

    // ========================================================================
    // Encode
    // ========================================================================

    Result<void> StructEngine::Encode(EncodeContext& context, const SchemaType& type, const Value& value) noexcept
    {
        auto members = CheckMembers(type, value);
        if (!members.HasValue())
        {
            return members;
        }
        return type.IsTlv() ? EncodeTlv(context, type, value) : EncodeFixed(context, type, value);
    }

    Result<void> StructEngine::EncodeFixed(EncodeContext& context, const SchemaType& type, const Value& value) noexcept
    {
        for (const auto& field : type.GetFields())
        {
            const Value* member = value.FindField(field.name);
            if (member == nullptr)
            {
                return MissingMember(type, field);
            }

            auto result = ValueCodec::Encode(context, *field.type, *member,
                                             Placement::Nested(false, field.lengthFieldWidth));
            if (!result.HasValue())
            {
                return result;
            }
        }
        return Result<void>::FromValue();
    }

    Result<void> StructEngine::EncodeTlv(EncodeContext& context, const SchemaType& type, const Value& value) noexcept
    {
        for (const auto& field : type.GetFields())
        {
            const Value* member = value.FindField(field.name);
            if (member == nullptr)
            {
                // Absence is expressed by omitting the whole entry
                if (field.optional)
                {
                    continue;
                }
                return MissingMember(type, field);
            }

            auto result = EncodeTlvEntry(context, field, *member);
            if (!result.HasValue())
            {
                return result;
            }
        }
        return Result<void>::FromValue();
    }

    Result<void> StructEngine::EncodeTlvEntry(EncodeContext& context, const SchemaField& field, const Value& value) noexcept
    {
        const SchemaType& type = *field.type;
        const Options& options = context.GetOptions();
        WireWriter& writer = context.GetWriter();

        auto width = ResolveLengthFieldWidth(type, Placement::Nested(true, field.lengthFieldWidth), options);
        if (!width.HasValue())
        {
            return Result<void>::FromError(width.Error());
        }

        // Smallest-width selection needs the body size before the tag is written
        if (width.Value() != 0 && options.GetTlvLengthSelection() == LengthSelection::kSmallest)
        {
            ByteBuffer scratch;
            WireWriter scratchWriter(scratch);
            EncodeContext scratchContext(options, scratchWriter, context.GetDepth());

            auto body = ValueCodec::EncodeBody(scratchContext, type, value, true);
            if (!body.HasValue())
            {
                return body;
            }

            lap::core::UInt8 chosen = SmallestLengthFieldWidth(scratch.size());
            auto tag = WireTag::Pack(WireTypeForLengthField(chosen), field.id);
            if (!tag.HasValue())
            {
                return Result<void>::FromError(tag.Error());
            }

            writer.WriteBytes(tag.Value().data(), kTagSize);
            auto length = writer.WriteLength(scratch.size(), chosen);
            if (!length.HasValue())
            {
                return length;
            }
            writer.WriteBytes(scratch.data(), scratch.size());
            return Result<void>::FromValue();
        }

        WireType wireType = type.IsFixedSize()
                          ? WireTypeForFixedSize(SizeOf(type.GetPrimitiveKind()))
                          : WireTypeForLengthField(width.Value());

        auto tag = WireTag::Pack(wireType, field.id);
        if (!tag.HasValue())
        {
            return Result<void>::FromError(tag.Error());
        }
        writer.WriteBytes(tag.Value().data(), kTagSize);

        return ValueCodec::EncodeFramed(context, type, value, width.Value());
    }

    // ========================================================================
    // Decode
    // ========================================================================

    Result<Value> StructEngine::Decode(DecodeContext& context, const SchemaType& type) noexcept
    {
        return type.IsTlv() ? DecodeTlv(context, type) : DecodeFixed(context, type);
    }

    Result<Value> StructEngine::DecodeFixed(DecodeContext& context, const SchemaType& type) noexcept
    {
        Value result = Value::MakeStruct();

        for (const auto& field : type.GetFields())
        {
            auto member = ValueCodec::Decode(context, *field.type, Placement::Nested(false, field.lengthFieldWidth));
            if (!member.HasValue())
            {
                LAP_SOMEIP_LOG_DEBUG << "StructEngine: " << type.GetName().c_str() << "." << field.name.c_str()
                                     << " failed: " << member.Error().Message();
                return member;
            }
            result.SetField(field.name, member.Value());
        }
        return Result<Value>::FromValue(std::move(result));
    }

    Result<Value> StructEngine::DecodeTlv(DecodeContext& context, const SchemaType& type) noexcept
    {
        WireReader& reader = context.GetReader();
        const Options& options = context.GetOptions();
        const auto& fields = type.GetFields();

        lap::core::Vector<Value> members(fields.size());
        lap::core::Vector<bool> present(fields.size(), false);

        while (!reader.AtEnd())
        {
            lap::core::Size entryOffset = reader.Position();

            auto raw = reader.ReadInteger<lap::core::UInt16>(ByteOrder::kBigEndian);
            if (!raw.HasValue())
            {
                return Result<Value>::FromError(raw.Error());
            }

            auto tag = WireTag::Unpack(static_cast<lap::core::UInt8>(raw.Value() >> 8),
                                       static_cast<lap::core::UInt8>(raw.Value() & 0xFF));
            if (!tag.HasValue())
            {
                LAP_SOMEIP_LOG_DEBUG << "StructEngine: reserved wire type at offset " << entryOffset;
                return Result<Value>::FromError(tag.Error());
            }

            const WireTag& entry = tag.Value();
            const SchemaField* field = type.FindFieldById(entry.dataId);
            if (field == nullptr)
            {
                auto skipped = SkipUnknown(context, entry.wireType, entry.dataId);
                if (!skipped.HasValue())
                {
                    return Result<Value>::FromError(skipped.Error());
                }
                continue;
            }

            lap::core::Size index = static_cast<lap::core::Size>(field - fields.data());
            if (present[index])
            {
                LAP_SOMEIP_LOG_DEBUG << "StructEngine: duplicate id " << entry.dataId << " at offset " << entryOffset;
                return Result<Value>::FromError(MakeErrorCode(SomeIpErrc::kDuplicateFieldId, entry.dataId));
            }

            const SchemaType& memberType = *field->type;
            auto width = ResolveLengthFieldWidth(memberType, Placement::Nested(true, field->lengthFieldWidth), options);
            if (!width.HasValue())
            {
                return Result<Value>::FromError(width.Error());
            }

            WireType expected = memberType.IsFixedSize()
                              ? WireTypeForFixedSize(SizeOf(memberType.GetPrimitiveKind()))
                              : WireTypeForLengthField(width.Value());
            lap::core::UInt8 usedWidth = width.Value();

            if (entry.wireType != expected)
            {
                bool acceptOther = IsLengthDelimited(expected) && IsLengthDelimited(entry.wireType) &&
                                   (options.GetWireTypeCheck() == WireTypeCheck::kLenient ||
                                    options.GetTlvLengthSelection() == LengthSelection::kSmallest);
                if (!acceptOther)
                {
                    LAP_SOMEIP_LOG_DEBUG << "StructEngine: " << type.GetName().c_str() << "." << field->name.c_str()
                                         << " expects " << ToString(expected) << ", got " << ToString(entry.wireType);
                    return Result<Value>::FromError(MakeErrorCode(SomeIpErrc::kWireTypeMismatch, entry.dataId));
                }
                usedWidth = LengthFieldWidthOf(entry.wireType);
            }

            auto member = ValueCodec::DecodeFramed(context, memberType, usedWidth);
            if (!member.HasValue())
            {
                LAP_SOMEIP_LOG_DEBUG << "StructEngine: " << type.GetName().c_str() << "." << field->name.c_str()
                                     << " failed: " << member.Error().Message();
                return member;
            }

            members[index] = member.Value();
            present[index] = true;
        }

        Value result = Value::MakeStruct();
        for (lap::core::Size i = 0; i < fields.size(); ++i)
        {
            if (present[i])
            {
                result.SetField(fields[i].name, members[i]);
            }
            else if (!fields[i].optional)
            {
                auto missing = MissingMember(type, fields[i]);
                return Result<Value>::FromError(missing.Error());
            }
        }
        return Result<Value>::FromValue(std::move(result));
    }

    Result<void> StructEngine::SkipUnknown(DecodeContext& context, WireType wireType, lap::core::UInt16 dataId) noexcept
    {
        WireReader& reader = context.GetReader();

        lap::core::UInt32 fixed = FixedSizeOf(wireType);
        if (fixed != 0)
        {
            LAP_SOMEIP_LOG_VERBOSE << "StructEngine: skipping unknown id " << dataId << " (" << fixed << " bytes)";
            return reader.Skip(fixed);
        }

        if (IsLengthDelimited(wireType))
        {
            auto length = reader.ReadLength(LengthFieldWidthOf(wireType));
            if (!length.HasValue())
            {
                return Result<void>::FromError(length.Error());
            }
            LAP_SOMEIP_LOG_VERBOSE << "StructEngine: skipping unknown id " << dataId << " (" << length.Value() << " bytes)";
            return reader.Skip(static_cast<lap::core::Size>(length.Value()));
        }

        // Without a length field the extent of an unknown complex value is unknowable
        LAP_SOMEIP_LOG_DEBUG << "StructEngine: cannot skip unknown id " << dataId << " with wire type " << ToString(wireType);
        return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kUnsupportedWireType, dataId));
    }

} // namespace serialization
} // namespace someip
} // namespace lap
