/**
 * @file        StringCodec.hpp
 * @author      LightAP Development Team
 * @brief       String payload codec (UTF-8 / UTF-16, BOM, terminator)
 * @date        2025-12-02
 * @details     Host strings are UTF-8. On the wire the text is re-encoded per the
 *              policy string encoding, optionally preceded by a byte order mark and
 *              followed by a NUL terminator. Size bounds apply to the encoded bytes.
 *              The surrounding length field is written by ValueCodec.
 * @copyright   Copyright (c) 2025
 * @note        AUTOSAR PRS_SOMEIP_00084 - PRS_SOMEIP_00094
 * @version     1.0
 */
#ifndef LAP_SOMEIP_STRING_CODEC_HPP
#define LAP_SOMEIP_STRING_CODEC_HPP

#include "CodecContext.hpp"
#include "Value.hpp"

namespace lap
{
namespace someip
{
namespace serialization
{
    class StringCodec final
    {
    public:
        /**
         * @brief Encode a string body
         * @return kValueSchemaMismatch, kInvalidStringEncoding, kNotEnoughData or kTooMuchData
         */
        static Result<void> Encode(EncodeContext& context, const SchemaType& type, const Value& value) noexcept;

        /**
         * @brief Decode a string body
         * @param bounded The body spans the rest of the current window; otherwise
         *                the type is statically sized and minSize bytes are read
         * @note A body above maxSize is handled by the policy's TooMuchDataAction. Discarded
         *       bytes are cut before the terminator check, so a truncated terminated string
         *       reports kInvalidStringEncoding.
         */
        static Result<Value> Decode(DecodeContext& context, const SchemaType& type, bool bounded) noexcept;

        /**
         * @brief Wire bytes of a host string under a policy
         */
        static Result<ByteBuffer> EncodeText(const Options& options, const String& text) noexcept;

        /**
         * @brief Host string from wire bytes under a policy
         */
        static Result<String> DecodeText(const Options& options, ByteView bytes) noexcept;
    };

} // namespace serialization
} // namespace someip
} // namespace lap

#endif // LAP_SOMEIP_STRING_CODEC_HPP
