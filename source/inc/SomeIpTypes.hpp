/**
 * @file        SomeIpTypes.hpp
 * @author      LightAP Development Team
 * @brief       SOME/IP payload serialization fundamental types
 * @date        2025-12-02
 * @details     Vocabulary types, logging macros and the SomeIp error domain shared by
 *              the serialization engine, its configuration loaders and tools.
 * @copyright   Copyright (c) 2025
 * @note        AUTOSAR PRS SOME/IP Protocol R22-11, chapter 4.1.4 (Serialization of Data Structures)
 * @version     1.0
 */
#ifndef LAP_SOMEIP_SOMEIP_TYPES_HPP
#define LAP_SOMEIP_SOMEIP_TYPES_HPP

#include <core/CTypedef.hpp>
#include <core/CString.hpp>
#include <core/CResult.hpp>
#include <core/COptional.hpp>
#include <core/CSpan.hpp>
#include <lap/log/CLog.hpp>

#include <cstdint>
#include <memory>

namespace lap
{
namespace someip
{
    // Import commonly used types from lap::core
    using lap::core::Result;
    using lap::core::Optional;
    using lap::core::String;
    using lap::core::ErrorCode;

    /**
     * @brief Encoded payload buffer (append-only during encode)
     */
    using ByteBuffer = lap::core::Vector<lap::core::UInt8>;

    /**
     * @brief Read-only view of an encoded payload
     */
    using ByteView = lap::core::Span<const lap::core::UInt8>;

    // ========================================================================
    // Logging Configuration
    // ========================================================================
    #define LAP_SOMEIP_LOG_CONTEXT_ID       "SIP"
    #define LAP_SOMEIP_LOG_CONTEXT_DESC     "SOME/IP serialization log ctx"

#ifdef LAP_DEBUG
    #define LAP_SOMEIP_LOG                  LAP_LOG( LAP_SOMEIP_LOG_CONTEXT_ID, LAP_SOMEIP_LOG_CONTEXT_DESC, ::lap::log::LogLevel::kVerbose )
    #define LAP_SOMEIP_LOG_VERBOSE          LAP_SOMEIP_LOG.LogVerbose().WithLocation( __FILE__, __LINE__ )
    #define LAP_SOMEIP_LOG_DEBUG            LAP_SOMEIP_LOG.LogDebug().WithLocation( __FILE__, __LINE__ )
    #define LAP_SOMEIP_LOG_INFO             LAP_SOMEIP_LOG.LogInfo().WithLocation( __FILE__, __LINE__ )
#else
    #define LAP_SOMEIP_LOG                  LAP_LOG( LAP_SOMEIP_LOG_CONTEXT_ID, LAP_SOMEIP_LOG_CONTEXT_DESC, ::lap::log::LogLevel::kWarn )
    #define LAP_SOMEIP_LOG_VERBOSE          LAP_SOMEIP_LOG.LogOff()
    #define LAP_SOMEIP_LOG_DEBUG            LAP_SOMEIP_LOG.LogOff()
    #define LAP_SOMEIP_LOG_INFO             LAP_SOMEIP_LOG.LogOff()
#endif
    #define LAP_SOMEIP_LOG_WARN             LAP_SOMEIP_LOG.LogWarn().WithLocation( __FILE__, __LINE__ )
    #define LAP_SOMEIP_LOG_ERROR            LAP_SOMEIP_LOG.LogError().WithLocation( __FILE__, __LINE__ )
    #define LAP_SOMEIP_LOG_FATAL            LAP_SOMEIP_LOG.LogFatal().WithLocation( __FILE__, __LINE__ )

    // ========================================================================
    // SOME/IP Serialization Error Codes
    // ========================================================================

    /**
     * @brief SOME/IP serialization error domain enumeration
     */
    enum class SomeIpErrc : lap::core::ErrorDomain::CodeType
    {
        // ====================================================================
        // Wire Errors (0x01 - 0x1F), reported per encode/decode call
        // ====================================================================
        kUnexpectedEndOfInput       = 0x01,  ///< Input ended before the value was complete
        kWireTypeMismatch           = 0x02,  ///< Tag wire type disagrees with the declared field type
        kMissingMandatoryField      = 0x03,  ///< Mandatory TLV field not present in its region
        kInvalidStringEncoding      = 0x04,  ///< String bytes are not well-formed for the encoding
        kValueTooLarge              = 0x05,  ///< Length does not fit the length field width
        kLengthMismatch             = 0x06,  ///< Decoding did not consume a length-bounded region exactly
        kUnknownDiscriminant        = 0x07,  ///< Union selector matches no variant
        kUnknownTreatAsValue        = 0x08,  ///< treat-as encoded value matches no variant
        kSchemaTooDeep              = 0x09,  ///< Nesting exceeds the configured depth bound
        kInvalidBooleanValue        = 0x0A,  ///< Boolean byte other than 0 or 1
        kUnsupportedWireType        = 0x0B,  ///< Reserved wire type, or a wire type that cannot be skipped
        kDuplicateFieldId           = 0x0C,  ///< Same data id seen twice in one TLV region
        kNotEnoughData              = 0x0D,  ///< Fewer bytes/elements than the declared minimum
        kTooMuchData                = 0x0E,  ///< More bytes/elements than the declared maximum
        kValueSchemaMismatch        = 0x0F,  ///< Value shape does not match the schema type

        // ====================================================================
        // Schema Errors (0x100 - 0x1FF), reported when building descriptions
        // ====================================================================
        kFieldIdOutOfRange          = 0x100, ///< Data id does not fit 12 bits
        kOptionalInNonTlvStruct     = 0x101, ///< Optional field declared in a non-TLV struct
        kInvalidLengthFieldWidth    = 0x102, ///< Width not in {0,1,2,4} or 0 for a dynamic size
        kDuplicateFieldName         = 0x103, ///< Two fields share a name
        kInvalidSizeBounds          = 0x104, ///< Minimum bound exceeds maximum bound
        kDuplicateDiscriminant      = 0x105, ///< Two union variants share a selector or name
        kInvalidTreatAs             = 0x106, ///< treat-as override is not applicable
        kEmptyUnion                 = 0x107, ///< Union declared without variants
        kNullType                   = 0x108, ///< Missing type description
        kInvalidOptions             = 0x109, ///< Option value out of its legal range

        // ====================================================================
        // Configuration Errors (0x200 - 0x2FF)
        // ====================================================================
        kConfigLoadFailed           = 0x200, ///< YAML document could not be read or parsed
        kUnknownTypeReference       = 0x201, ///< Schema refers to an undeclared type
    };

    /**
     * @brief SOME/IP serialization error domain
     */
    class SomeIpErrorDomain final : public lap::core::ErrorDomain
    {
    public:
        using Errc = SomeIpErrc;
        using Exception = lap::core::Exception;

        constexpr SomeIpErrorDomain() noexcept
            : ErrorDomain(ErrorDomain::IdType{0x8000000000000116})
        {}

        const char* Name() const noexcept override
        {
            return "SomeIp";
        }

        const char* Message(CodeType errorCode) const noexcept override
        {
            auto code = static_cast<SomeIpErrc>(errorCode);
            switch (code)
            {
                case SomeIpErrc::kUnexpectedEndOfInput:
                    return "Unexpected end of input";
                case SomeIpErrc::kWireTypeMismatch:
                    return "Wire type does not match the declared field type";
                case SomeIpErrc::kMissingMandatoryField:
                    return "Mandatory field missing";
                case SomeIpErrc::kInvalidStringEncoding:
                    return "Invalid string encoding";
                case SomeIpErrc::kValueTooLarge:
                    return "Value too large for length field";
                case SomeIpErrc::kLengthMismatch:
                    return "Length-delimited region not consumed exactly";
                case SomeIpErrc::kUnknownDiscriminant:
                    return "Unknown union discriminant";
                case SomeIpErrc::kUnknownTreatAsValue:
                    return "Unknown treat-as value";
                case SomeIpErrc::kSchemaTooDeep:
                    return "Schema nesting too deep";
                case SomeIpErrc::kInvalidBooleanValue:
                    return "Invalid boolean value";
                case SomeIpErrc::kUnsupportedWireType:
                    return "Unsupported wire type";
                case SomeIpErrc::kDuplicateFieldId:
                    return "Duplicate field id in TLV region";
                case SomeIpErrc::kNotEnoughData:
                    return "Not enough data for declared minimum";
                case SomeIpErrc::kTooMuchData:
                    return "More data than declared maximum";
                case SomeIpErrc::kValueSchemaMismatch:
                    return "Value does not match schema";
                case SomeIpErrc::kFieldIdOutOfRange:
                    return "Field id exceeds 12 bits";
                case SomeIpErrc::kOptionalInNonTlvStruct:
                    return "Optional field in non-TLV struct";
                case SomeIpErrc::kInvalidLengthFieldWidth:
                    return "Invalid length field width";
                case SomeIpErrc::kDuplicateFieldName:
                    return "Duplicate field name";
                case SomeIpErrc::kInvalidSizeBounds:
                    return "Minimum size exceeds maximum size";
                case SomeIpErrc::kDuplicateDiscriminant:
                    return "Duplicate union variant";
                case SomeIpErrc::kInvalidTreatAs:
                    return "Invalid treat-as override";
                case SomeIpErrc::kEmptyUnion:
                    return "Union without variants";
                case SomeIpErrc::kNullType:
                    return "Missing type description";
                case SomeIpErrc::kInvalidOptions:
                    return "Invalid serialization options";
                case SomeIpErrc::kConfigLoadFailed:
                    return "Failed to load configuration";
                case SomeIpErrc::kUnknownTypeReference:
                    return "Unknown type reference";
                default:
                    return "Unknown SOME/IP serialization error";
            }
        }

        void ThrowAsException(const ErrorCode& errorCode) const noexcept(false) override
        {
            throw Exception(errorCode);
        }
    };

    // Global instance of SomeIpErrorDomain
    constexpr SomeIpErrorDomain g_someIpErrorDomain;

    /**
     * @brief Get the SOME/IP serialization error domain
     * @return Reference to the global SomeIpErrorDomain instance
     */
    constexpr const lap::core::ErrorDomain& GetSomeIpErrorDomain() noexcept
    {
        return g_someIpErrorDomain;
    }

    /**
     * @brief Create an ErrorCode in the SOME/IP serialization domain
     * @param code Error code enumeration value
     * @param data Optional support data (field id or byte offset)
     * @return ErrorCode instance
     */
    constexpr ErrorCode MakeErrorCode(SomeIpErrc code,
                                      lap::core::ErrorDomain::SupportDataType data =
                                      lap::core::ErrorDomain::SupportDataType()) noexcept
    {
        return ErrorCode(static_cast<lap::core::ErrorDomain::CodeType>(code),
                        GetSomeIpErrorDomain(), data);
    }

    /**
     * @brief Check whether an error code belongs to the schema range
     */
    inline bool IsSchemaError(const ErrorCode& error) noexcept
    {
        return error.Value() >= static_cast<lap::core::ErrorDomain::CodeType>(SomeIpErrc::kFieldIdOutOfRange)
            && error.Value() < static_cast<lap::core::ErrorDomain::CodeType>(SomeIpErrc::kConfigLoadFailed);
    }

    /**
     * @brief Check whether an error code belongs to the wire range
     */
    inline bool IsWireError(const ErrorCode& error) noexcept
    {
        return error.Value() >= static_cast<lap::core::ErrorDomain::CodeType>(SomeIpErrc::kUnexpectedEndOfInput)
            && error.Value() <= static_cast<lap::core::ErrorDomain::CodeType>(SomeIpErrc::kValueSchemaMismatch);
    }

} // namespace someip
} // namespace lap

#endif // LAP_SOMEIP_SOMEIP_TYPES_HPP
