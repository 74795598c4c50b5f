/**
 * @file        StructEngine.hpp
 * @author      LightAP Development Team
 * @brief       Struct codec in fixed (non-TLV) and tag-length-value mode
 * @date        2025-12-02
 * @details     Non-TLV structs concatenate their fields in declaration order. TLV
 *              structs frame each field as Tag [+ Length] + Value; on decode the
 *              entries may come in any order, unknown ids are skipped, absent
 *              optional fields are omitted and absent mandatory fields are errors.
 * @copyright   Copyright (c) 2025
 * @note        AUTOSAR PRS_SOMEIP_00077, PRS_SOMEIP_00201 - PRS_SOMEIP_00212
 * @version     1.0
 */
#ifndef LAP_SOMEIP_STRUCT_ENGINE_HPP
#define LAP_SOMEIP_STRUCT_ENGINE_HPP

#include "CodecContext.hpp"
#include "Value.hpp"

namespace lap
{
namespace someip
{
namespace serialization
{
    class StructEngine final
    {
    public:
        /**
         * @brief Encode the members of a struct
         * @return kValueSchemaMismatch for unknown or ill-typed members,
         *         kMissingMandatoryField for an absent mandatory member
         */
        static Result<void> Encode(EncodeContext& context, const SchemaType& type, const Value& value) noexcept;

        /**
         * @brief Decode the members of a struct
         * @details A TLV struct consumes tag entries until the current window (or the
         *          input) is exhausted.
         */
        static Result<Value> Decode(DecodeContext& context, const SchemaType& type) noexcept;

    private:
        static Result<void> EncodeFixed(EncodeContext& context, const SchemaType& type, const Value& value) noexcept;

        static Result<void> EncodeTlv(EncodeContext& context, const SchemaType& type, const Value& value) noexcept;

        static Result<void> EncodeTlvEntry(EncodeContext& context, const SchemaField& field, const Value& value) noexcept;

        static Result<Value> DecodeFixed(DecodeContext& context, const SchemaType& type) noexcept;

        static Result<Value> DecodeTlv(DecodeContext& context, const SchemaType& type) noexcept;

        static Result<void> SkipUnknown(DecodeContext& context, WireType wireType, lap::core::UInt16 dataId) noexcept;
    };

} // namespace serialization
} // namespace someip
} // namespace lap

#endif // LAP_SOMEIP_STRUCT_ENGINE_HPP
