/**
 * @file        Value.hpp
 * @author      LightAP Development Team
 * @brief       Dynamic value model encoded and decoded against a schema
 * @date        2025-12-02
 * @copyright   Copyright (c) 2025
 * @version     1.0
 */
#ifndef LAP_SOMEIP_VALUE_HPP
#define LAP_SOMEIP_VALUE_HPP

#include "Schema.hpp"

namespace lap
{
namespace someip
{
namespace serialization
{
    /**
     * @brief Value kinds, one per schema type kind
     */
    enum class ValueKind : lap::core::UInt8
    {
        kPrimitive     = 0,
        kString        = 1,
        kSequence      = 2,
        kStruct        = 3,
        kUnion         = 4
    };

    /**
     * @brief Closed tagged value
     * @details Primitives keep their raw bit pattern (two's complement for signed
     *          integers, IEEE-754 for floats). Struct fields are keyed by name and
     *          kept in insertion order; absent optional fields are simply missing.
     *          A union holds the selected variant name and, for non-unit variants,
     *          one payload value.
     */
    class Value final
    {
    public:
        Value() noexcept = default;

        static Value MakeBool(bool value) noexcept;
        static Value MakeUInt8(lap::core::UInt8 value) noexcept;
        static Value MakeUInt16(lap::core::UInt16 value) noexcept;
        static Value MakeUInt32(lap::core::UInt32 value) noexcept;
        static Value MakeUInt64(lap::core::UInt64 value) noexcept;
        static Value MakeInt8(lap::core::Int8 value) noexcept;
        static Value MakeInt16(lap::core::Int16 value) noexcept;
        static Value MakeInt32(lap::core::Int32 value) noexcept;
        static Value MakeInt64(lap::core::Int64 value) noexcept;
        static Value MakeFloat32(float value) noexcept;
        static Value MakeFloat64(double value) noexcept;

        /**
         * @brief Primitive from its raw bit pattern, truncated to the kind's width
         */
        static Value MakePrimitive(PrimitiveKind kind, lap::core::UInt64 bits) noexcept;

        static Value MakeString(const String& text) noexcept;
        static Value MakeSequence(lap::core::Vector<Value> elements) noexcept;
        static Value MakeStruct() noexcept;
        static Value MakeUnion(const String& variant) noexcept;
        static Value MakeUnion(const String& variant, Value payload) noexcept;

        ValueKind GetKind() const noexcept { return m_kind; }

        PrimitiveKind GetPrimitiveKind() const noexcept { return m_primitive; }

        /// Raw bit pattern of a primitive
        lap::core::UInt64 GetBits() const noexcept { return m_bits; }

        bool AsBool() const noexcept { return m_bits != 0; }

        lap::core::UInt64 AsUInt64() const noexcept { return m_bits; }

        /// Sign-extended integer value
        lap::core::Int64 AsInt64() const noexcept;

        double AsDouble() const noexcept;

        /// String text, or the variant name of a union
        const String& GetText() const noexcept { return m_text; }

        const lap::core::Vector<Value>& GetElements() const noexcept { return m_children; }

        /**
         * @brief Set or replace a struct field
         * @return *this for chaining
         */
        Value& SetField(const String& name, Value value) noexcept;

        lap::core::Size GetFieldCount() const noexcept { return m_names.size(); }

        const String& GetFieldName(lap::core::Size index) const noexcept { return m_names[index]; }

        const Value& GetFieldValue(lap::core::Size index) const noexcept { return m_children[index]; }

        /// Struct field by name, nullptr when absent
        const Value* FindField(const String& name) const noexcept;

        const String& GetVariantName() const noexcept { return m_text; }

        bool HasPayload() const noexcept { return m_kind == ValueKind::kUnion && !m_children.empty(); }

        const Value& GetPayload() const noexcept { return m_children.front(); }

        bool operator==(const Value& other) const noexcept;

        bool operator!=(const Value& other) const noexcept { return !(*this == other); }

    private:
        ValueKind m_kind{ValueKind::kPrimitive};
        PrimitiveKind m_primitive{PrimitiveKind::kBool};
        lap::core::UInt64 m_bits{0};
        String m_text;
        lap::core::Vector<Value> m_children;
        lap::core::Vector<String> m_names;
    };

    /**
     * @brief Render a value for diagnostics, e.g. {x: 1, y: "a"}
     */
    String FormatValue(const Value& value) noexcept;

} // namespace serialization
} // namespace someip
} // namespace lap

#endif // LAP_SOMEIP_VALUE_HPP
