/**
 * @file        Serializer.hpp
 * @author      LightAP Development Team
 * @brief       Stateless encode/decode entry points
 * @date        2025-12-02
 * @details     Each call is independent: options and schema are read-only, the output
 *              buffer (encode) or input view (decode) is owned by the caller for the
 *              duration of the call. Malformed input yields a typed error, never a
 *              partial value.
 * @copyright   Copyright (c) 2025
 * @note        AUTOSAR PRS SOME/IP R22-11, 4.1.4
 * @version     1.0
 */
#ifndef LAP_SOMEIP_SERIALIZER_HPP
#define LAP_SOMEIP_SERIALIZER_HPP

#include "Options.hpp"
#include "Schema.hpp"
#include "Value.hpp"
#include "WireTag.hpp"

namespace lap
{
namespace someip
{
namespace serialization
{
    /**
     * @brief Encode a value into a new buffer
     * @param value Value shaped like @p schema
     * @param schema Type description
     * @param options Wire-format policy
     * @return Encoded bytes or the first error
     */
    Result<ByteBuffer> Encode(const Value& value, const SchemaType& schema, const Options& options) noexcept;

    /**
     * @brief Encode a value, appending to an existing buffer
     * @note On error the buffer is restored to its previous size
     */
    Result<void> EncodeInto(const Value& value,
                            const SchemaType& schema,
                            const Options& options,
                            ByteBuffer& buffer) noexcept;

    /**
     * @brief Decode a value from bytes
     * @return Value or the first error; leftover bytes fail kLengthMismatch
     */
    Result<Value> Decode(ByteView bytes, const SchemaType& schema, const Options& options) noexcept;

    /**
     * @brief Raw tag entry of a TLV region
     */
    struct TlvEntry
    {
        WireTag tag;
        lap::core::Size offset{0};      ///< Offset of the tag
        lap::core::Size valueSize{0};   ///< Value bytes, excluding tag and length field
    };

    /**
     * @brief List the tag entries of a TLV region without a schema
     * @return Entries, or kUnsupportedWireType for a complex entry whose extent is unknown
     */
    Result<lap::core::Vector<TlvEntry>> ScanTlvEntries(ByteView bytes) noexcept;

} // namespace serialization
} // namespace someip
} // namespace lap

#endif // LAP_SOMEIP_SERIALIZER_HPP
