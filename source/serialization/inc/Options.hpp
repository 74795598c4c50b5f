/**
 * @file        Options.hpp
 * @author      LightAP Development Team
 * @brief       Wire-format policy for SOME/IP payload serialization
 * @date        2025-12-02
 * @details     Byte order, string encoding and default length field widths. Options are
 *              validated once at construction and then shared read-only across calls.
 * @copyright   Copyright (c) 2025
 * @note        AUTOSAR PRS_SOMEIP_00065, PRS_SOMEIP_00084, PRS_SOMEIP_00230
 * @version     1.0
 */
#ifndef LAP_SOMEIP_OPTIONS_HPP
#define LAP_SOMEIP_OPTIONS_HPP

#include "SomeIpTypes.hpp"

namespace lap
{
namespace someip
{
namespace serialization
{
    /**
     * @brief Payload byte order
     */
    enum class ByteOrder : lap::core::UInt8
    {
        kBigEndian     = 0,    ///< Big-endian (network byte order)
        kLittleEndian  = 1     ///< Little-endian
    };

    /**
     * @brief String encoding on the wire
     */
    enum class StringEncoding : lap::core::UInt8
    {
        kUtf8          = 0,    ///< UTF-8
        kUtf16BE       = 1,    ///< UTF-16 big-endian
        kUtf16LE       = 2,    ///< UTF-16 little-endian
        kAscii         = 3     ///< 7-bit ASCII, no byte order mark
    };

    /**
     * @brief Categories with an independent default length field width
     */
    enum class LengthFieldCategory : lap::core::UInt8
    {
        kArray         = 0,    ///< Sequences and opaque byte runs
        kString        = 1,    ///< Strings
        kStruct        = 2,    ///< Structs
        kUnion         = 3     ///< Unions
    };

    /**
     * @brief How length field widths are chosen inside TLV structs
     */
    enum class LengthSelection : lap::core::UInt8
    {
        kConfigured    = 0,    ///< Always the resolved width, overflow fails
        kSmallest      = 1     ///< Smallest of 1/2/4 bytes that holds the length
    };

    /**
     * @brief How a known TLV field's wire type is checked on decode
     */
    enum class WireTypeCheck : lap::core::UInt8
    {
        kStrict        = 0,    ///< Observed wire type must equal the declared one
        kLenient       = 1     ///< Any length-delimited wire type satisfies a length-delimited field
    };

    /**
     * @brief What decoding does with a string or sequence longer than its maximum
     */
    enum class TooMuchDataAction : lap::core::UInt8
    {
        kFail          = 0,    ///< Report kTooMuchData
        kDiscard       = 1,    ///< Keep up to the maximum, skip the rest of the length window
        kKeep          = 2     ///< Keep everything beyond the maximum
    };

    /// Number of length field categories
    constexpr lap::core::UInt8 kLengthFieldCategoryCount = 4;

    /// Default bound on struct/sequence/union nesting
    constexpr lap::core::UInt32 kDefaultMaxDepth = 32;

    /// Largest accepted nesting bound
    constexpr lap::core::UInt32 kMaxDepthLimit = 1024;

    /**
     * @brief Check whether a width is one of {0,1,2,4}
     */
    constexpr bool IsValidLengthFieldWidth(lap::core::UInt8 width) noexcept
    {
        return width == 0 || width == 1 || width == 2 || width == 4;
    }

    /**
     * @brief Mutable description of a policy, validated by Options::Create
     */
    struct OptionsConfig
    {
        ByteOrder byteOrder{ByteOrder::kBigEndian};
        StringEncoding stringEncoding{StringEncoding::kUtf8};
        bool stringWithBom{false};
        bool stringWithTerminator{false};
        lap::core::UInt8 arrayLengthWidth{4};
        lap::core::UInt8 stringLengthWidth{4};
        lap::core::UInt8 structLengthWidth{4};
        lap::core::UInt8 unionLengthWidth{4};
        lap::core::UInt8 unionSelectorWidth{4};
        LengthSelection tlvLengthSelection{LengthSelection::kConfigured};
        WireTypeCheck wireTypeCheck{WireTypeCheck::kStrict};
        lap::core::UInt32 maxDepth{kDefaultMaxDepth};
        TooMuchDataAction tooMuchData{TooMuchDataAction::kFail};
    };

    /**
     * @brief Immutable serialization policy
     * @note Every byte order and length field decision of the engine is taken from
     *       here or from an explicit per-type/per-field override.
     */
    class Options final
    {
    public:
        /**
         * @brief Validate a policy description
         * @param config Policy description
         * @return Options or kInvalidLengthFieldWidth / kInvalidOptions
         * @note ASCII strings cannot carry a byte order mark.
         */
        static Result<Options> Create(const OptionsConfig& config) noexcept;

        /**
         * @brief Reference policy bundle used for conformance tests
         * @details Big-endian, UTF-8 without BOM or terminator, 4-byte length fields
         *          for every category, 4-byte union selector, strict wire types.
         */
        static const Options& Reference() noexcept;

        /**
         * @brief AUTOSAR default policy bundle
         * @details As Reference() but strings carry a BOM and a NUL terminator.
         */
        static const Options& Autosar() noexcept;

        ByteOrder GetByteOrder() const noexcept { return m_config.byteOrder; }

        StringEncoding GetStringEncoding() const noexcept { return m_config.stringEncoding; }

        bool IsStringWithBom() const noexcept { return m_config.stringWithBom; }

        bool IsStringWithTerminator() const noexcept { return m_config.stringWithTerminator; }

        /**
         * @brief Default length field width of a category
         * @return Width in bytes, one of {0,1,2,4}
         */
        lap::core::UInt8 GetLengthFieldWidth(LengthFieldCategory category) const noexcept;

        lap::core::UInt8 GetUnionSelectorWidth() const noexcept { return m_config.unionSelectorWidth; }

        LengthSelection GetTlvLengthSelection() const noexcept { return m_config.tlvLengthSelection; }

        WireTypeCheck GetWireTypeCheck() const noexcept { return m_config.wireTypeCheck; }

        lap::core::UInt32 GetMaxDepth() const noexcept { return m_config.maxDepth; }

        TooMuchDataAction GetTooMuchDataAction() const noexcept { return m_config.tooMuchData; }

        const OptionsConfig& GetConfig() const noexcept { return m_config; }

    private:
        explicit Options(const OptionsConfig& config) noexcept
            : m_config(config)
        {}

        OptionsConfig m_config;
    };

    /**
     * @brief Printable name of a byte order ("big" / "little")
     */
    const char* ToString(ByteOrder order) noexcept;

    /**
     * @brief Printable name of a string encoding ("utf8" / "utf16be" / "utf16le" / "ascii")
     */
    const char* ToString(StringEncoding encoding) noexcept;

    const char* ToString(TooMuchDataAction action) noexcept;

} // namespace serialization
} // namespace someip
} // namespace lap

#endif // LAP_SOMEIP_OPTIONS_HPP
