/**
 * @file        SequenceCodec.cpp
 * @author      LightAP Development Team
 * @brief       Homogeneous sequence codec implementation
 * @date        2025-12-02
 * @copyright   Copyright (c) 2025
 */

#include "SequenceCodec.hpp"
#include "ValueCodec.hpp"

namespace lap
{
namespace someip
{
namespace serialization
{
    namespace
    {
        Result<void> CheckCount(const SequenceBounds& bounds, lap::core::Size count) noexcept
        {
            if (count < bounds.minElements)
            {
                LAP_SOMEIP_LOG_DEBUG << "SequenceCodec: " << count << " elements, minimum " << bounds.minElements;
                return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kNotEnoughData,
                    static_cast<lap::core::ErrorDomain::SupportDataType>(count)));
            }
            if (count > bounds.maxElements)
            {
                LAP_SOMEIP_LOG_DEBUG << "SequenceCodec: " << count << " elements, maximum " << bounds.maxElements;
                return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kTooMuchData,
                    static_cast<lap::core::ErrorDomain::SupportDataType>(count)));
            }
            return Result<void>::FromValue();
        }

        bool IsByteSequence(const SchemaType& element) noexcept
        {
            return element.GetKind() == TypeKind::kPrimitive &&
                   element.GetPrimitiveKind() == PrimitiveKind::kUInt8;
        }
    } // namespace

    Result<void> SequenceCodec::Encode(EncodeContext& context,
                                       const SchemaType& type,
                                       const Value& value,
                                       bool bounded) noexcept
    {
        if (value.GetKind() != ValueKind::kSequence)
        {
            return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kValueSchemaMismatch));
        }

        const auto& elements = value.GetElements();
        auto count = CheckCount(type.GetSequenceBounds(), elements.size());
        if (!count.HasValue())
        {
            return count;
        }

        const SchemaType& element = *type.GetElementType();
        if (IsByteSequence(element))
        {
            WireWriter& writer = context.GetWriter();
            for (const auto& item : elements)
            {
                if (item.GetKind() != ValueKind::kPrimitive || item.GetPrimitiveKind() != PrimitiveKind::kUInt8)
                {
                    return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kValueSchemaMismatch));
                }
                writer.WriteByte(static_cast<lap::core::UInt8>(item.GetBits()));
            }
            return Result<void>::FromValue();
        }

        const Placement placement = Placement::Nested(false);
        WireWriter& writer = context.GetWriter();
        for (const auto& item : elements)
        {
            lap::core::Size before = writer.Size();
            auto result = ValueCodec::Encode(context, element, item, placement);
            if (!result.HasValue())
            {
                return result;
            }
            // Zero-sized elements behind a length field cannot be counted on decode
            if (bounded && writer.Size() == before)
            {
                LAP_SOMEIP_LOG_DEBUG << "SequenceCodec: element of " << element.GetName().c_str()
                                     << " encodes to zero bytes inside a length field";
                return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kLengthMismatch,
                    static_cast<lap::core::ErrorDomain::SupportDataType>(before)));
            }
        }
        return Result<void>::FromValue();
    }

    Result<Value> SequenceCodec::Decode(DecodeContext& context, const SchemaType& type, bool bounded) noexcept
    {
        WireReader& reader = context.GetReader();
        const SchemaType& element = *type.GetElementType();
        const SequenceBounds& bounds = type.GetSequenceBounds();
        const TooMuchDataAction action = context.GetOptions().GetTooMuchDataAction();
        lap::core::Vector<Value> elements;

        if (IsByteSequence(element))
        {
            lap::core::Size size = bounded ? reader.Remaining() : bounds.minElements;
            lap::core::Size excess = 0;
            if (size > bounds.maxElements && action != TooMuchDataAction::kFail)
            {
                LAP_SOMEIP_LOG_DEBUG << "SequenceCodec: " << size << " bytes, maximum " << bounds.maxElements
                                     << ", action " << ToString(action);
                if (action == TooMuchDataAction::kDiscard)
                {
                    excess = size - bounds.maxElements;
                    size = bounds.maxElements;
                }
            }
            else
            {
                auto count = CheckCount(bounds, size);
                if (!count.HasValue())
                {
                    return Result<Value>::FromError(count.Error());
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

            elements.reserve(size);
            for (lap::core::Size i = 0; i < size; ++i)
            {
                elements.push_back(Value::MakeUInt8(bytes.Value().data()[i]));
            }
            return Result<Value>::FromValue(Value::MakeSequence(std::move(elements)));
        }

        const Placement placement = Placement::Nested(false);
        if (bounded)
        {
            while (!reader.AtEnd())
            {
                if (elements.size() == bounds.maxElements && action == TooMuchDataAction::kDiscard)
                {
                    LAP_SOMEIP_LOG_DEBUG << "SequenceCodec: discarding " << reader.Remaining()
                                         << " bytes after " << bounds.maxElements << " elements";
                    auto skipped = reader.Skip(reader.Remaining());
                    if (!skipped.HasValue())
                    {
                        return Result<Value>::FromError(skipped.Error());
                    }
                    break;
                }

                lap::core::Size before = reader.Position();
                auto item = ValueCodec::Decode(context, element, placement);
                if (!item.HasValue())
                {
                    return Result<Value>::FromError(item.Error());
                }
                // A zero-sized element could never exhaust the window
                if (reader.Position() == before)
                {
                    return Result<Value>::FromError(MakeErrorCode(SomeIpErrc::kLengthMismatch,
                        static_cast<lap::core::ErrorDomain::SupportDataType>(before)));
                }
                elements.push_back(std::move(item.Value()));
            }
        }
        else
        {
            for (lap::core::UInt32 i = 0; i < bounds.minElements; ++i)
            {
                auto item = ValueCodec::Decode(context, element, placement);
                if (!item.HasValue())
                {
                    return Result<Value>::FromError(item.Error());
                }
                elements.push_back(std::move(item.Value()));
            }
        }

        if (elements.size() > bounds.maxElements && action == TooMuchDataAction::kKeep)
        {
            LAP_SOMEIP_LOG_DEBUG << "SequenceCodec: keeping " << elements.size() << " elements, maximum "
                                 << bounds.maxElements;
            return Result<Value>::FromValue(Value::MakeSequence(std::move(elements)));
        }

        auto count = CheckCount(bounds, elements.size());
        if (!count.HasValue())
        {
            return Result<Value>::FromError(count.Error());
        }
        return Result<Value>::FromValue(Value::MakeSequence(std::move(elements)));
    }

} // namespace serialization
} // namespace someip
} // namespace lap
