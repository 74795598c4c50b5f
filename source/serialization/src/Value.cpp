/**
 * @file        Value.cpp
 * @author      LightAP Development Team
 * @brief       Dynamic value model implementation
 * @date        2025-12-02
 * @copyright   Copyright (c) 2025
 */

#include "Value.hpp"

#include <cstring>
#include <sstream>

namespace lap
{
namespace someip
{
namespace serialization
{
    namespace
    {
        lap::core::UInt64 MaskFor(PrimitiveKind kind) noexcept
        {
            lap::core::UInt32 size = SizeOf(kind);
            return size >= 8 ? ~0ULL : ((1ULL << (8U * size)) - 1ULL);
        }

        void FormatInto(std::ostringstream& oss, const Value& value)
        {
            switch (value.GetKind())
            {
                case ValueKind::kPrimitive:
                {
                    PrimitiveKind kind = value.GetPrimitiveKind();
                    if (kind == PrimitiveKind::kBool)
                    {
                        oss << (value.AsBool() ? "true" : "false");
                    }
                    else if (kind == PrimitiveKind::kFloat32 || kind == PrimitiveKind::kFloat64)
                    {
                        oss << value.AsDouble();
                    }
                    else if (IsSigned(kind))
                    {
                        oss << value.AsInt64();
                    }
                    else
                    {
                        oss << value.AsUInt64();
                    }
                    break;
                }
                case ValueKind::kString:
                    oss << '"' << value.GetText().c_str() << '"';
                    break;
                case ValueKind::kSequence:
                {
                    oss << '[';
                    const auto& elements = value.GetElements();
                    for (lap::core::Size i = 0; i < elements.size(); ++i)
                    {
                        if (i != 0)
                        {
                            oss << ", ";
                        }
                        FormatInto(oss, elements[i]);
                    }
                    oss << ']';
                    break;
                }
                case ValueKind::kStruct:
                {
                    oss << '{';
                    for (lap::core::Size i = 0; i < value.GetFieldCount(); ++i)
                    {
                        if (i != 0)
                        {
                            oss << ", ";
                        }
                        oss << value.GetFieldName(i).c_str() << ": ";
                        FormatInto(oss, value.GetFieldValue(i));
                    }
                    oss << '}';
                    break;
                }
                case ValueKind::kUnion:
                    oss << value.GetVariantName().c_str();
                    if (value.HasPayload())
                    {
                        oss << '(';
                        FormatInto(oss, value.GetPayload());
                        oss << ')';
                    }
                    break;
            }
        }
    } // namespace

    // ========================================================================
    // Factories
    // ========================================================================

    Value Value::MakePrimitive(PrimitiveKind kind, lap::core::UInt64 bits) noexcept
    {
        Value value;
        value.m_kind = ValueKind::kPrimitive;
        value.m_primitive = kind;
        value.m_bits = bits & MaskFor(kind);
        if (kind == PrimitiveKind::kBool)
        {
            value.m_bits = value.m_bits != 0 ? 1 : 0;
        }
        return value;
    }

    Value Value::MakeBool(bool value) noexcept
    {
        return MakePrimitive(PrimitiveKind::kBool, value ? 1 : 0);
    }

    Value Value::MakeUInt8(lap::core::UInt8 value) noexcept
    {
        return MakePrimitive(PrimitiveKind::kUInt8, value);
    }

    Value Value::MakeUInt16(lap::core::UInt16 value) noexcept
    {
        return MakePrimitive(PrimitiveKind::kUInt16, value);
    }

    Value Value::MakeUInt32(lap::core::UInt32 value) noexcept
    {
        return MakePrimitive(PrimitiveKind::kUInt32, value);
    }

    Value Value::MakeUInt64(lap::core::UInt64 value) noexcept
    {
        return MakePrimitive(PrimitiveKind::kUInt64, value);
    }

    Value Value::MakeInt8(lap::core::Int8 value) noexcept
    {
        return MakePrimitive(PrimitiveKind::kInt8, static_cast<lap::core::UInt64>(static_cast<lap::core::Int64>(value)));
    }

    Value Value::MakeInt16(lap::core::Int16 value) noexcept
    {
        return MakePrimitive(PrimitiveKind::kInt16, static_cast<lap::core::UInt64>(static_cast<lap::core::Int64>(value)));
    }

    Value Value::MakeInt32(lap::core::Int32 value) noexcept
    {
        return MakePrimitive(PrimitiveKind::kInt32, static_cast<lap::core::UInt64>(static_cast<lap::core::Int64>(value)));
    }

    Value Value::MakeInt64(lap::core::Int64 value) noexcept
    {
        return MakePrimitive(PrimitiveKind::kInt64, static_cast<lap::core::UInt64>(value));
    }

    Value Value::MakeFloat32(float value) noexcept
    {
        lap::core::UInt32 bits = 0;
        std::memcpy(&bits, &value, sizeof(bits));
        return MakePrimitive(PrimitiveKind::kFloat32, bits);
    }

    Value Value::MakeFloat64(double value) noexcept
    {
        lap::core::UInt64 bits = 0;
        std::memcpy(&bits, &value, sizeof(bits));
        return MakePrimitive(PrimitiveKind::kFloat64, bits);
    }

    Value Value::MakeString(const String& text) noexcept
    {
        Value value;
        value.m_kind = ValueKind::kString;
        value.m_text = text;
        return value;
    }

    Value Value::MakeSequence(lap::core::Vector<Value> elements) noexcept
    {
        Value value;
        value.m_kind = ValueKind::kSequence;
        value.m_children = std::move(elements);
        return value;
    }

    Value Value::MakeStruct() noexcept
    {
        Value value;
        value.m_kind = ValueKind::kStruct;
        return value;
    }

    Value Value::MakeUnion(const String& variant) noexcept
    {
        Value value;
        value.m_kind = ValueKind::kUnion;
        value.m_text = variant;
        return value;
    }

    Value Value::MakeUnion(const String& variant, Value payload) noexcept
    {
        Value value = MakeUnion(variant);
        value.m_children.push_back(std::move(payload));
        return value;
    }

    // ========================================================================
    // Accessors
    // ========================================================================

    lap::core::Int64 Value::AsInt64() const noexcept
    {
        lap::core::UInt32 size = SizeOf(m_primitive);
        if (size >= 8 || !IsSigned(m_primitive))
        {
            return static_cast<lap::core::Int64>(m_bits);
        }

        lap::core::UInt64 signBit = 1ULL << (8U * size - 1U);
        lap::core::UInt64 extended = (m_bits ^ signBit) - signBit;
        return static_cast<lap::core::Int64>(extended);
    }

    double Value::AsDouble() const noexcept
    {
        switch (m_primitive)
        {
            case PrimitiveKind::kFloat32:
            {
                float value = 0.0F;
                lap::core::UInt32 bits = static_cast<lap::core::UInt32>(m_bits);
                std::memcpy(&value, &bits, sizeof(value));
                return value;
            }
            case PrimitiveKind::kFloat64:
            {
                double value = 0.0;
                std::memcpy(&value, &m_bits, sizeof(value));
                return value;
            }
            default:
                return IsSigned(m_primitive) ? static_cast<double>(AsInt64()) : static_cast<double>(m_bits);
        }
    }

    Value& Value::SetField(const String& name, Value value) noexcept
    {
        for (lap::core::Size i = 0; i < m_names.size(); ++i)
        {
            if (m_names[i] == name)
            {
                m_children[i] = std::move(value);
                return *this;
            }
        }

        m_names.push_back(name);
        m_children.push_back(std::move(value));
        return *this;
    }

    const Value* Value::FindField(const String& name) const noexcept
    {
        for (lap::core::Size i = 0; i < m_names.size(); ++i)
        {
            if (m_names[i] == name)
            {
                return &m_children[i];
            }
        }
        return nullptr;
    }

    bool Value::operator==(const Value& other) const noexcept
    {
        if (m_kind != other.m_kind)
        {
            return false;
        }

        switch (m_kind)
        {
            case ValueKind::kPrimitive:
                return m_primitive == other.m_primitive && m_bits == other.m_bits;
            case ValueKind::kString:
                return m_text == other.m_text;
            case ValueKind::kSequence:
                return m_children == other.m_children;
            case ValueKind::kStruct:
            {
                if (m_names.size() != other.m_names.size())
                {
                    return false;
                }
                // Field order carries no meaning
                for (lap::core::Size i = 0; i < m_names.size(); ++i)
                {
                    const Value* field = other.FindField(m_names[i]);
                    if (field == nullptr || !(*field == m_children[i]))
                    {
                        return false;
                    }
                }
                return true;
            }
            case ValueKind::kUnion:
                return m_text == other.m_text && m_children == other.m_children;
        }
        return false;
    }

    String FormatValue(const Value& value) noexcept
    {
        std::ostringstream oss;
        FormatInto(oss, value);
        return String(oss.str().c_str());
    }

} // namespace serialization
} // namespace someip
} // namespace lap
