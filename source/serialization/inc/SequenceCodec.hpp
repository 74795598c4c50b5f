/**
 * @file        SequenceCodec.hpp
 * @author      LightAP Development Team
 * @brief       Homogeneous sequence codec
 * @date        2025-12-02
 * @details     The length field of a sequence holds the encoded byte length of its
 *              elements, not the element count. Sequences of uint8 take a bulk path.
 * @copyright   Copyright (c) 2025
 * @note        AUTOSAR PRS_SOMEIP_00917, PRS_SOMEIP_00376
 * @version     1.0
 */
#ifndef LAP_SOMEIP_SEQUENCE_CODEC_HPP
#define LAP_SOMEIP_SEQUENCE_CODEC_HPP

#include "CodecContext.hpp"
#include "Value.hpp"

namespace lap
{
namespace someip
{
namespace serialization
{
    class SequenceCodec final
    {
    public:
        /**
         * @brief Encode the elements of a sequence
         * @param bounded The elements are written behind a length field
         * @return kValueSchemaMismatch, kNotEnoughData, kTooMuchData, kLengthMismatch
         *         (zero-sized element behind a length field) or an element error
         */
        static Result<void> Encode(EncodeContext& context,
                                   const SchemaType& type,
                                   const Value& value,
                                   bool bounded) noexcept;

        /**
         * @brief Decode the elements of a sequence
         * @param bounded Decode elements until the current window is exhausted;
         *                otherwise decode exactly minElements elements
         * @note More than maxElements elements are handled by the policy's TooMuchDataAction
         */
        static Result<Value> Decode(DecodeContext& context, const SchemaType& type, bool bounded) noexcept;
    };

} // namespace serialization
} // namespace someip
} // namespace lap

#endif // LAP_SOMEIP_SEQUENCE_CODEC_HPP
