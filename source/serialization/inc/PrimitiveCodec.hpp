/**
 * @file        PrimitiveCodec.hpp
 * @author      LightAP Development Team
 * @brief       Fixed-width integer, float and boolean codec
 * @date        2025-12-02
 * @copyright   Copyright (c) 2025
 * @note        AUTOSAR PRS_SOMEIP_00065, PRS_SOMEIP_00615
 * @version     1.0
 */
#ifndef LAP_SOMEIP_PRIMITIVE_CODEC_HPP
#define LAP_SOMEIP_PRIMITIVE_CODEC_HPP

#include "CodecContext.hpp"
#include "Value.hpp"

namespace lap
{
namespace someip
{
namespace serialization
{
    class PrimitiveCodec final
    {
    public:
        /**
         * @brief Encode a primitive value in payload byte order
         * @return kValueSchemaMismatch if the value is not a primitive of @p kind
         */
        static Result<void> Encode(EncodeContext& context, PrimitiveKind kind, const Value& value) noexcept;

        /**
         * @brief Decode a primitive value
         * @return Value, kUnexpectedEndOfInput or kInvalidBooleanValue
         */
        static Result<Value> Decode(DecodeContext& context, PrimitiveKind kind) noexcept;

        /// Write the low SizeOf(kind) bytes of a bit pattern
        static void EncodeBits(EncodeContext& context, PrimitiveKind kind, lap::core::UInt64 bits) noexcept;

        /// Read SizeOf(kind) bytes as a zero-extended bit pattern
        static Result<lap::core::UInt64> DecodeBits(DecodeContext& context, PrimitiveKind kind) noexcept;
    };

} // namespace serialization
} // namespace someip
} // namespace lap

#endif // LAP_SOMEIP_PRIMITIVE_CODEC_HPP
