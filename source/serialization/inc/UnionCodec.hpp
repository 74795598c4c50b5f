/**
 * @file        UnionCodec.hpp
 * @author      LightAP Development Team
 * @brief       Union / enumeration codec with treat-as override
 * @date        2025-12-02
 * @details     By default a union is a policy-width selector followed by the payload
 *              of the selected variant. Under a treat-as override a union of unit
 *              variants is encoded as a bare integer whose value identifies the variant.
 * @copyright   Copyright (c) 2025
 * @note        AUTOSAR PRS_SOMEIP_00118 - PRS_SOMEIP_00128
 * @version     1.0
 */
#ifndef LAP_SOMEIP_UNION_CODEC_HPP
#define LAP_SOMEIP_UNION_CODEC_HPP

#include "CodecContext.hpp"
#include "Value.hpp"

namespace lap
{
namespace someip
{
namespace serialization
{
    class UnionCodec final
    {
    public:
        /**
         * @brief Encode a union value
         * @return kUnknownDiscriminant for an undeclared variant name,
         *         kValueSchemaMismatch for a payload that does not match the variant
         */
        static Result<void> Encode(EncodeContext& context, const SchemaType& type, const Value& value) noexcept;

        /**
         * @brief Decode a union value
         * @return kUnknownDiscriminant / kUnknownTreatAsValue when no variant matches
         */
        static Result<Value> Decode(DecodeContext& context, const SchemaType& type) noexcept;
    };

} // namespace serialization
} // namespace someip
} // namespace lap

#endif // LAP_SOMEIP_UNION_CODEC_HPP
