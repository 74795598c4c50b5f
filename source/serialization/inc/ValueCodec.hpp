/**
 * @file        ValueCodec.hpp
 * @author      LightAP Development Team
 * @brief       Type dispatch and length field framing
 * @date        2025-12-02
 * @details     Every nested value passes through here: the length field width is
 *              resolved from the placement, the length is reserved and back-patched
 *              on encode, and a bounded window is opened on decode before the
 *              kind-specific codec takes over.
 * @copyright   Copyright (c) 2025
 * @version     1.0
 */
#ifndef LAP_SOMEIP_VALUE_CODEC_HPP
#define LAP_SOMEIP_VALUE_CODEC_HPP

#include "CodecContext.hpp"
#include "Value.hpp"

namespace lap
{
namespace someip
{
namespace serialization
{
    class ValueCodec final
    {
    public:
        /**
         * @brief Encode a value with the length field its placement requires
         */
        static Result<void> Encode(EncodeContext& context,
                                   const SchemaType& type,
                                   const Value& value,
                                   const Placement& placement) noexcept;

        /**
         * @brief Encode a value behind a length field of a known width (0 = none)
         */
        static Result<void> EncodeFramed(EncodeContext& context,
                                         const SchemaType& type,
                                         const Value& value,
                                         lap::core::UInt8 width) noexcept;

        /**
         * @brief Encode the value itself, without any length field
         * @param bounded The value is written behind a length field
         */
        static Result<void> EncodeBody(EncodeContext& context,
                                       const SchemaType& type,
                                       const Value& value,
                                       bool bounded) noexcept;

        /**
         * @brief Decode a value with the length field its placement requires
         */
        static Result<Value> Decode(DecodeContext& context,
                                    const SchemaType& type,
                                    const Placement& placement) noexcept;

        /**
         * @brief Decode a value behind a length field of a known width (0 = none)
         */
        static Result<Value> DecodeFramed(DecodeContext& context,
                                          const SchemaType& type,
                                          lap::core::UInt8 width) noexcept;

        /**
         * @brief Decode the value itself
         * @param bounded The value spans exactly the rest of the current window
         */
        static Result<Value> DecodeBody(DecodeContext& context,
                                        const SchemaType& type,
                                        bool bounded) noexcept;
    };

} // namespace serialization
} // namespace someip
} // namespace lap

#endif // LAP_SOMEIP_VALUE_CODEC_HPP
