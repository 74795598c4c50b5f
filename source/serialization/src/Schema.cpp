/**
 * @file        Schema.cpp
 * @author      LightAP Development Team
 * @brief       Type description construction and validation
 * @date        2025-12-02
 * @copyright   Copyright (c) 2025
 */

#include "Schema.hpp"
#include "Options.hpp"
#include "WireTag.hpp"

#include <limits>

namespace lap
{
namespace someip
{
namespace serialization
{
    namespace
    {
        Result<void> ValidateWidthOverride(const Optional<lap::core::UInt8>& width,
                                           bool staticallySized,
                                           bool fixedSize) noexcept
        {
            if (!width.has_value())
            {
                return Result<void>::FromValue();
            }

            if (fixedSize || !IsValidLengthFieldWidth(width.value()) ||
                (width.value() == 0 && !staticallySized))
            {
                return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kInvalidLengthFieldWidth, width.value()));
            }
            return Result<void>::FromValue();
        }

        bool FitsKind(lap::core::Int64 value, PrimitiveKind kind) noexcept
        {
            switch (kind)
            {
                case PrimitiveKind::kUInt8:
                    return value >= 0 && value <= std::numeric_limits<lap::core::UInt8>::max();
                case PrimitiveKind::kUInt16:
                    return value >= 0 && value <= std::numeric_limits<lap::core::UInt16>::max();
                case PrimitiveKind::kUInt32:
                    return value >= 0 && value <= std::numeric_limits<lap::core::UInt32>::max();
                case PrimitiveKind::kUInt64:
                    return value >= 0;
                case PrimitiveKind::kInt8:
                    return value >= std::numeric_limits<lap::core::Int8>::min() &&
                           value <= std::numeric_limits<lap::core::Int8>::max();
                case PrimitiveKind::kInt16:
                    return value >= std::numeric_limits<lap::core::Int16>::min() &&
                           value <= std::numeric_limits<lap::core::Int16>::max();
                case PrimitiveKind::kInt32:
                    return value >= std::numeric_limits<lap::core::Int32>::min() &&
                           value <= std::numeric_limits<lap::core::Int32>::max();
                case PrimitiveKind::kInt64:
                    return true;
                default:
                    return false;
            }
        }

        Result<SchemaTypePtr> Fail(SomeIpErrc code,
                                   const String& name,
                                   lap::core::ErrorDomain::SupportDataType data = 0) noexcept
        {
            LAP_SOMEIP_LOG_ERROR << "Schema '" << name.c_str() << "': "
                                 << GetSomeIpErrorDomain().Message(static_cast<lap::core::ErrorDomain::CodeType>(code));
            return Result<SchemaTypePtr>::FromError(MakeErrorCode(code, data));
        }
    } // namespace

    // ========================================================================
    // Primitive kinds
    // ========================================================================

    lap::core::UInt32 SizeOf(PrimitiveKind kind) noexcept
    {
        switch (kind)
        {
            case PrimitiveKind::kBool:
            case PrimitiveKind::kUInt8:
            case PrimitiveKind::kInt8:
                return 1;
            case PrimitiveKind::kUInt16:
            case PrimitiveKind::kInt16:
                return 2;
            case PrimitiveKind::kUInt32:
            case PrimitiveKind::kInt32:
            case PrimitiveKind::kFloat32:
                return 4;
            case PrimitiveKind::kUInt64:
            case PrimitiveKind::kInt64:
            case PrimitiveKind::kFloat64:
                return 8;
        }
        return 0;
    }

    bool IsInteger(PrimitiveKind kind) noexcept
    {
        return kind != PrimitiveKind::kBool &&
               kind != PrimitiveKind::kFloat32 &&
               kind != PrimitiveKind::kFloat64;
    }

    bool IsSigned(PrimitiveKind kind) noexcept
    {
        return kind == PrimitiveKind::kInt8 || kind == PrimitiveKind::kInt16 ||
               kind == PrimitiveKind::kInt32 || kind == PrimitiveKind::kInt64;
    }

    const char* ToString(PrimitiveKind kind) noexcept
    {
        switch (kind)
        {
            case PrimitiveKind::kBool:    return "bool";
            case PrimitiveKind::kUInt8:   return "uint8";
            case PrimitiveKind::kUInt16:  return "uint16";
            case PrimitiveKind::kUInt32:  return "uint32";
            case PrimitiveKind::kUInt64:  return "uint64";
            case PrimitiveKind::kInt8:    return "int8";
            case PrimitiveKind::kInt16:   return "int16";
            case PrimitiveKind::kInt32:   return "int32";
            case PrimitiveKind::kInt64:   return "int64";
            case PrimitiveKind::kFloat32: return "float32";
            case PrimitiveKind::kFloat64: return "float64";
        }
        return "unknown";
    }

    const char* ToString(TypeKind kind) noexcept
    {
        switch (kind)
        {
            case TypeKind::kPrimitive: return "primitive";
            case TypeKind::kString:    return "string";
            case TypeKind::kSequence:  return "sequence";
            case TypeKind::kStruct:    return "struct";
            case TypeKind::kUnion:     return "union";
        }
        return "unknown";
    }

    Optional<PrimitiveKind> ParsePrimitiveKind(const String& name) noexcept
    {
        static const PrimitiveKind kinds[] = {
            PrimitiveKind::kBool, PrimitiveKind::kUInt8, PrimitiveKind::kUInt16,
            PrimitiveKind::kUInt32, PrimitiveKind::kUInt64, PrimitiveKind::kInt8,
            PrimitiveKind::kInt16, PrimitiveKind::kInt32, PrimitiveKind::kInt64,
            PrimitiveKind::kFloat32, PrimitiveKind::kFloat64
        };

        for (auto kind : kinds)
        {
            if (name == ToString(kind))
            {
                return Optional<PrimitiveKind>(kind);
            }
        }
        return Optional<PrimitiveKind>();
    }

    // ========================================================================
    // SchemaType factories
    // ========================================================================

    Result<SchemaTypePtr> SchemaType::CreatePrimitive(PrimitiveKind kind) noexcept
    {
        std::shared_ptr<SchemaType> type(new SchemaType(TypeKind::kPrimitive));
        type->m_name = ToString(kind);
        type->m_primitive = kind;
        type->m_static = true;
        return Result<SchemaTypePtr>::FromValue(type);
    }

    Result<SchemaTypePtr> SchemaType::CreateString(const StringBounds& bounds,
                                                   Optional<lap::core::UInt8> lengthFieldWidth) noexcept
    {
        if (bounds.minSize > bounds.maxSize)
        {
            return Fail(SomeIpErrc::kInvalidSizeBounds, "string", bounds.minSize);
        }

        bool staticallySized = bounds.minSize == bounds.maxSize;
        auto widthCheck = ValidateWidthOverride(lengthFieldWidth, staticallySized, false);
        if (!widthCheck.HasValue())
        {
            return Fail(SomeIpErrc::kInvalidLengthFieldWidth, "string", lengthFieldWidth.value());
        }

        std::shared_ptr<SchemaType> type(new SchemaType(TypeKind::kString));
        type->m_name = "string";
        type->m_stringBounds = bounds;
        type->m_lengthFieldWidth = lengthFieldWidth;
        type->m_static = staticallySized;
        return Result<SchemaTypePtr>::FromValue(type);
    }

    Result<SchemaTypePtr> SchemaType::CreateSequence(SchemaTypePtr element,
                                                     const SequenceBounds& bounds,
                                                     Optional<lap::core::UInt8> lengthFieldWidth) noexcept
    {
        if (!element)
        {
            return Fail(SomeIpErrc::kNullType, "sequence");
        }
        if (bounds.minElements > bounds.maxElements)
        {
            return Fail(SomeIpErrc::kInvalidSizeBounds, "sequence", bounds.minElements);
        }

        bool staticallySized = bounds.minElements == bounds.maxElements && element->IsStaticallySized();
        auto widthCheck = ValidateWidthOverride(lengthFieldWidth, staticallySized, false);
        if (!widthCheck.HasValue())
        {
            return Fail(SomeIpErrc::kInvalidLengthFieldWidth, "sequence", lengthFieldWidth.value());
        }

        std::shared_ptr<SchemaType> type(new SchemaType(TypeKind::kSequence));
        type->m_name = String("sequence<") + element->GetName() + ">";
        type->m_element = std::move(element);
        type->m_sequenceBounds = bounds;
        type->m_lengthFieldWidth = lengthFieldWidth;
        type->m_static = staticallySized;
        return Result<SchemaTypePtr>::FromValue(type);
    }

    Result<SchemaTypePtr> SchemaType::CreateStruct(const String& name,
                                                   lap::core::Vector<SchemaField> fields,
                                                   bool tlv,
                                                   Optional<lap::core::UInt8> lengthFieldWidth) noexcept
    {
        bool staticallySized = !tlv;

        for (lap::core::Size i = 0; i < fields.size(); ++i)
        {
            const SchemaField& field = fields[i];

            if (field.id > kMaxDataId)
            {
                return Fail(SomeIpErrc::kFieldIdOutOfRange, name, field.id);
            }
            if (!field.type)
            {
                return Fail(SomeIpErrc::kNullType, name, field.id);
            }
            if (field.optional && !tlv)
            {
                return Fail(SomeIpErrc::kOptionalInNonTlvStruct, name, field.id);
            }

            auto widthCheck = ValidateWidthOverride(field.lengthFieldWidth,
                                                    field.type->IsStaticallySized(),
                                                    field.type->IsFixedSize());
            if (!widthCheck.HasValue())
            {
                return Fail(SomeIpErrc::kInvalidLengthFieldWidth, name, field.id);
            }

            for (lap::core::Size j = 0; j < i; ++j)
            {
                if (fields[j].name == field.name)
                {
                    return Fail(SomeIpErrc::kDuplicateFieldName, name, field.id);
                }
                if (fields[j].id == field.id)
                {
                    return Fail(SomeIpErrc::kDuplicateFieldId, name, field.id);
                }
            }

            staticallySized = staticallySized && field.type->IsStaticallySized();
        }

        auto widthCheck = ValidateWidthOverride(lengthFieldWidth, staticallySized, false);
        if (!widthCheck.HasValue())
        {
            return Fail(SomeIpErrc::kInvalidLengthFieldWidth, name, lengthFieldWidth.value());
        }

        std::shared_ptr<SchemaType> type(new SchemaType(TypeKind::kStruct));
        type->m_name = name;
        type->m_fields = std::move(fields);
        type->m_tlv = tlv;
        type->m_lengthFieldWidth = lengthFieldWidth;
        type->m_static = staticallySized;
        return Result<SchemaTypePtr>::FromValue(type);
    }

    Result<SchemaTypePtr> SchemaType::CreateUnion(const String& name,
                                                  lap::core::Vector<UnionVariant> variants,
                                                  Optional<PrimitiveKind> treatAs,
                                                  Optional<lap::core::UInt8> lengthFieldWidth) noexcept
    {
        if (variants.empty())
        {
            return Fail(SomeIpErrc::kEmptyUnion, name);
        }

        bool treatAsSet = treatAs.has_value();
        if (treatAsSet && !IsInteger(treatAs.value()))
        {
            return Fail(SomeIpErrc::kInvalidTreatAs, name);
        }

        for (lap::core::Size i = 0; i < variants.size(); ++i)
        {
            const UnionVariant& variant = variants[i];

            if (treatAsSet)
            {
                if (variant.payload || !variant.treatAsValue.has_value() ||
                    !FitsKind(variant.treatAsValue.value(), treatAs.value()))
                {
                    return Fail(SomeIpErrc::kInvalidTreatAs, name, variant.discriminant);
                }
            }
            else if (variant.treatAsValue.has_value())
            {
                return Fail(SomeIpErrc::kInvalidTreatAs, name, variant.discriminant);
            }

            for (lap::core::Size j = 0; j < i; ++j)
            {
                bool clash = variants[j].name == variant.name ||
                             variants[j].discriminant == variant.discriminant;
                if (treatAsSet)
                {
                    clash = clash || variants[j].treatAsValue.value() == variant.treatAsValue.value();
                }
                if (clash)
                {
                    return Fail(SomeIpErrc::kDuplicateDiscriminant, name, variant.discriminant);
                }
            }
        }

        auto widthCheck = ValidateWidthOverride(lengthFieldWidth, treatAsSet, treatAsSet);
        if (!widthCheck.HasValue())
        {
            return Fail(SomeIpErrc::kInvalidLengthFieldWidth, name, lengthFieldWidth.value());
        }

        std::shared_ptr<SchemaType> type(new SchemaType(TypeKind::kUnion));
        type->m_name = name;
        type->m_variants = std::move(variants);
        type->m_treatAs = treatAsSet;
        if (treatAsSet)
        {
            type->m_primitive = treatAs.value();
        }
        type->m_lengthFieldWidth = lengthFieldWidth;
        type->m_static = treatAsSet;
        return Result<SchemaTypePtr>::FromValue(type);
    }

    // ========================================================================
    // Lookups
    // ========================================================================

    const SchemaField* SchemaType::FindFieldById(lap::core::UInt16 id) const noexcept
    {
        for (const auto& field : m_fields)
        {
            if (field.id == id)
            {
                return &field;
            }
        }
        return nullptr;
    }

    const SchemaField* SchemaType::FindFieldByName(const String& name) const noexcept
    {
        for (const auto& field : m_fields)
        {
            if (field.name == name)
            {
                return &field;
            }
        }
        return nullptr;
    }

    const UnionVariant* SchemaType::FindVariantByName(const String& name) const noexcept
    {
        for (const auto& variant : m_variants)
        {
            if (variant.name == name)
            {
                return &variant;
            }
        }
        return nullptr;
    }

    const UnionVariant* SchemaType::FindVariantByDiscriminant(lap::core::UInt32 discriminant) const noexcept
    {
        for (const auto& variant : m_variants)
        {
            if (variant.discriminant == discriminant)
            {
                return &variant;
            }
        }
        return nullptr;
    }

    const UnionVariant* SchemaType::FindVariantByTreatAsValue(lap::core::Int64 value) const noexcept
    {
        for (const auto& variant : m_variants)
        {
            if (variant.treatAsValue.has_value() && variant.treatAsValue.value() == value)
            {
                return &variant;
            }
        }
        return nullptr;
    }

    // ========================================================================
    // Convenience primitives
    // ========================================================================

    namespace types
    {
        SchemaTypePtr Primitive(PrimitiveKind kind) noexcept
        {
            return SchemaType::CreatePrimitive(kind).Value();
        }

        SchemaTypePtr Bool() noexcept { return Primitive(PrimitiveKind::kBool); }
        SchemaTypePtr UInt8() noexcept { return Primitive(PrimitiveKind::kUInt8); }
        SchemaTypePtr UInt16() noexcept { return Primitive(PrimitiveKind::kUInt16); }
        SchemaTypePtr UInt32() noexcept { return Primitive(PrimitiveKind::kUInt32); }
        SchemaTypePtr UInt64() noexcept { return Primitive(PrimitiveKind::kUInt64); }
        SchemaTypePtr Int8() noexcept { return Primitive(PrimitiveKind::kInt8); }
        SchemaTypePtr Int16() noexcept { return Primitive(PrimitiveKind::kInt16); }
        SchemaTypePtr Int32() noexcept { return Primitive(PrimitiveKind::kInt32); }
        SchemaTypePtr Int64() noexcept { return Primitive(PrimitiveKind::kInt64); }
        SchemaTypePtr Float32() noexcept { return Primitive(PrimitiveKind::kFloat32); }
        SchemaTypePtr Float64() noexcept { return Primitive(PrimitiveKind::kFloat64); }
    } // namespace types

} // namespace serialization
} // namespace someip
} // namespace lap
