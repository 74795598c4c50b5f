/**
 * @file        Schema.hpp
 * @author      LightAP Development Team
 * @brief       Structural type descriptions consumed by the serialization engine
 * @date        2025-12-02
 * @details     A schema is a closed set of type kinds {Primitive, String, Sequence,
 *              Struct, Union}. Descriptions are validated once by the Create factories
 *              and are immutable afterwards, so they can be shared across threads.
 * @copyright   Copyright (c) 2025
 * @note        AUTOSAR PRS_SOMEIP_00191, PRS_SOMEIP_00230 - PRS_SOMEIP_00251
 * @version     1.0
 */
#ifndef LAP_SOMEIP_SCHEMA_HPP
#define LAP_SOMEIP_SCHEMA_HPP

#include "SomeIpTypes.hpp"

namespace lap
{
namespace someip
{
namespace serialization
{
    /**
     * @brief Fixed-width primitive kinds
     */
    enum class PrimitiveKind : lap::core::UInt8
    {
        kBool          = 0,
        kUInt8         = 1,
        kUInt16        = 2,
        kUInt32        = 3,
        kUInt64        = 4,
        kInt8          = 5,
        kInt16         = 6,
        kInt32         = 7,
        kInt64         = 8,
        kFloat32       = 9,
        kFloat64       = 10
    };

    /**
     * @brief Type description kinds
     */
    enum class TypeKind : lap::core::UInt8
    {
        kPrimitive     = 0,
        kString        = 1,
        kSequence      = 2,
        kStruct        = 3,
        kUnion         = 4
    };

    /// Encoded size of a primitive in bytes
    lap::core::UInt32 SizeOf(PrimitiveKind kind) noexcept;

    bool IsInteger(PrimitiveKind kind) noexcept;

    bool IsSigned(PrimitiveKind kind) noexcept;

    const char* ToString(PrimitiveKind kind) noexcept;

    const char* ToString(TypeKind kind) noexcept;

    /**
     * @brief Parse a primitive name ("bool", "uint8" ... "float64")
     */
    Optional<PrimitiveKind> ParsePrimitiveKind(const String& name) noexcept;

    class SchemaType;

    /**
     * @brief Shared immutable type description
     */
    using SchemaTypePtr = std::shared_ptr<const SchemaType>;

    /**
     * @brief Byte-size bounds of a string, including BOM and terminator
     */
    struct StringBounds
    {
        lap::core::UInt32 minSize{0};
        lap::core::UInt32 maxSize{0xFFFFFFFFU};
    };

    /**
     * @brief Element-count bounds of a sequence
     */
    struct SequenceBounds
    {
        lap::core::UInt32 minElements{0};
        lap::core::UInt32 maxElements{0xFFFFFFFFU};
    };

    /**
     * @brief Field of a struct description
     */
    struct SchemaField
    {
        lap::core::UInt16 id{0};                    ///< Data id, 0..4095, unique within the struct
        String name;                                ///< Key of the field in a struct value
        SchemaTypePtr type;                         ///< Field type
        bool optional{false};                       ///< Absence allowed (TLV structs only)
        Optional<lap::core::UInt8> lengthFieldWidth; ///< Overrides type and policy widths
    };

    /**
     * @brief Variant of a union description
     */
    struct UnionVariant
    {
        String name;                                ///< Symbolic variant name
        lap::core::UInt32 discriminant{0};          ///< Selector value on the wire
        SchemaTypePtr payload;                      ///< Payload type, empty for unit variants
        Optional<lap::core::Int64> treatAsValue;    ///< Encoded value under a treat-as override
    };

    /**
     * @brief Immutable structural type description
     */
    class SchemaType final
    {
    public:
        /**
         * @brief Create a primitive description
         */
        static Result<SchemaTypePtr> CreatePrimitive(PrimitiveKind kind) noexcept;

        /**
         * @brief Create a string description
         * @param bounds Encoded byte-size bounds
         * @param lengthFieldWidth Width override for this type
         * @return Description or kInvalidSizeBounds / kInvalidLengthFieldWidth
         */
        static Result<SchemaTypePtr> CreateString(const StringBounds& bounds = StringBounds(),
                                                  Optional<lap::core::UInt8> lengthFieldWidth =
                                                  Optional<lap::core::UInt8>()) noexcept;

        /**
         * @brief Create a sequence description
         * @param element Element type
         * @param bounds Element-count bounds
         * @param lengthFieldWidth Width override for this type
         * @return Description or kNullType / kInvalidSizeBounds / kInvalidLengthFieldWidth
         */
        static Result<SchemaTypePtr> CreateSequence(SchemaTypePtr element,
                                                    const SequenceBounds& bounds = SequenceBounds(),
                                                    Optional<lap::core::UInt8> lengthFieldWidth =
                                                    Optional<lap::core::UInt8>()) noexcept;

        /**
         * @brief Create a struct description
         * @param name Type name used in diagnostics
         * @param fields Fields in declaration order
         * @param tlv Tag-length-value mode
         * @param lengthFieldWidth Width override for this type
         * @return Description or the first schema error found
         */
        static Result<SchemaTypePtr> CreateStruct(const String& name,
                                                  lap::core::Vector<SchemaField> fields,
                                                  bool tlv,
                                                  Optional<lap::core::UInt8> lengthFieldWidth =
                                                  Optional<lap::core::UInt8>()) noexcept;

        /**
         * @brief Create a union description
         * @param name Type name used in diagnostics
         * @param variants Variants, at least one
         * @param treatAs Encode the union as a bare integer of this kind
         * @param lengthFieldWidth Width override for this type
         * @return Description or the first schema error found
         */
        static Result<SchemaTypePtr> CreateUnion(const String& name,
                                                 lap::core::Vector<UnionVariant> variants,
                                                 Optional<PrimitiveKind> treatAs = Optional<PrimitiveKind>(),
                                                 Optional<lap::core::UInt8> lengthFieldWidth =
                                                 Optional<lap::core::UInt8>()) noexcept;

        TypeKind GetKind() const noexcept { return m_kind; }

        const String& GetName() const noexcept { return m_name; }

        /// Primitive kind; for a treat-as union the encoded kind
        PrimitiveKind GetPrimitiveKind() const noexcept { return m_primitive; }

        const StringBounds& GetStringBounds() const noexcept { return m_stringBounds; }

        const SequenceBounds& GetSequenceBounds() const noexcept { return m_sequenceBounds; }

        const SchemaTypePtr& GetElementType() const noexcept { return m_element; }

        const lap::core::Vector<SchemaField>& GetFields() const noexcept { return m_fields; }

        bool IsTlv() const noexcept { return m_tlv; }

        const lap::core::Vector<UnionVariant>& GetVariants() const noexcept { return m_variants; }

        bool IsTreatAs() const noexcept { return m_treatAs; }

        const Optional<lap::core::UInt8>& GetLengthFieldWidth() const noexcept { return m_lengthFieldWidth; }

        /**
         * @brief Whether the encoded size is known without a length field
         * @details Primitives, treat-as unions, strings with minSize == maxSize,
         *          sequences with fixed count of statically sized elements, and
         *          non-TLV structs of statically sized fields.
         */
        bool IsStaticallySized() const noexcept { return m_static; }

        /**
         * @brief Encoded as a bare fixed-size value (primitive or treat-as union)
         */
        bool IsFixedSize() const noexcept
        {
            return m_kind == TypeKind::kPrimitive || (m_kind == TypeKind::kUnion && m_treatAs);
        }

        const SchemaField* FindFieldById(lap::core::UInt16 id) const noexcept;

        const SchemaField* FindFieldByName(const String& name) const noexcept;

        const UnionVariant* FindVariantByName(const String& name) const noexcept;

        const UnionVariant* FindVariantByDiscriminant(lap::core::UInt32 discriminant) const noexcept;

        const UnionVariant* FindVariantByTreatAsValue(lap::core::Int64 value) const noexcept;

    private:
        explicit SchemaType(TypeKind kind) noexcept
            : m_kind(kind)
        {}

        TypeKind m_kind;
        String m_name;
        PrimitiveKind m_primitive{PrimitiveKind::kBool};
        StringBounds m_stringBounds;
        SequenceBounds m_sequenceBounds;
        SchemaTypePtr m_element;
        lap::core::Vector<SchemaField> m_fields;
        bool m_tlv{false};
        lap::core::Vector<UnionVariant> m_variants;
        bool m_treatAs{false};
        Optional<lap::core::UInt8> m_lengthFieldWidth;
        bool m_static{false};
    };

    /**
     * @brief Convenience wrappers for descriptions that cannot fail
     */
    namespace types
    {
        SchemaTypePtr Bool() noexcept;
        SchemaTypePtr UInt8() noexcept;
        SchemaTypePtr UInt16() noexcept;
        SchemaTypePtr UInt32() noexcept;
        SchemaTypePtr UInt64() noexcept;
        SchemaTypePtr Int8() noexcept;
        SchemaTypePtr Int16() noexcept;
        SchemaTypePtr Int32() noexcept;
        SchemaTypePtr Int64() noexcept;
        SchemaTypePtr Float32() noexcept;
        SchemaTypePtr Float64() noexcept;
        SchemaTypePtr Primitive(PrimitiveKind kind) noexcept;
    } // namespace types

} // namespace serialization
} // namespace someip
} // namespace lap

#endif // LAP_SOMEIP_SCHEMA_HPP
