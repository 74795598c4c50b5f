/**
 * @file        CodecContext.hpp
 * @author      LightAP Development Team
 * @brief       Per-call encode/decode state and length field resolution
 * @date        2025-12-02
 * @details     A context lives for exactly one Encode/Decode call. It binds the policy
 *              to the buffer and tracks nesting depth; nothing survives the call.
 * @copyright   Copyright (c) 2025
 * @version     1.0
 */
#ifndef LAP_SOMEIP_CODEC_CONTEXT_HPP
#define LAP_SOMEIP_CODEC_CONTEXT_HPP

#include "Options.hpp"
#include "Schema.hpp"
#include "WireBuffer.hpp"
#include "WireTag.hpp"

namespace lap
{
namespace someip
{
namespace serialization
{
    /**
     * @brief Where a value sits relative to its enclosing type
     */
    struct Placement
    {
        bool topLevel{false};                       ///< Root of an Encode/Decode call
        bool inTlv{false};                          ///< Member of a TLV struct
        Optional<lap::core::UInt8> fieldWidth;      ///< Length field override of the member

        static Placement TopLevel() noexcept
        {
            Placement placement;
            placement.topLevel = true;
            return placement;
        }

        static Placement Nested(bool inTlv,
                                Optional<lap::core::UInt8> fieldWidth = Optional<lap::core::UInt8>()) noexcept
        {
            Placement placement;
            placement.inTlv = inTlv;
            placement.fieldWidth = fieldWidth;
            return placement;
        }
    };

    /**
     * @brief Encode-side call state
     */
    class EncodeContext final
    {
    public:
        EncodeContext(const Options& options, WireWriter& writer, lap::core::UInt32 depth = 0) noexcept
            : m_options(options)
            , m_writer(writer)
            , m_depth(depth)
        {}

        const Options& GetOptions() const noexcept { return m_options; }

        WireWriter& GetWriter() noexcept { return m_writer; }

        lap::core::UInt32 GetDepth() const noexcept { return m_depth; }

        void Enter() noexcept { ++m_depth; }

        void Leave() noexcept { --m_depth; }

    private:
        const Options& m_options;
        WireWriter& m_writer;
        lap::core::UInt32 m_depth;
    };

    /**
     * @brief Decode-side call state
     */
    class DecodeContext final
    {
    public:
        DecodeContext(const Options& options, WireReader& reader) noexcept
            : m_options(options)
            , m_reader(reader)
            , m_depth(0)
        {}

        const Options& GetOptions() const noexcept { return m_options; }

        WireReader& GetReader() noexcept { return m_reader; }

        lap::core::UInt32 GetDepth() const noexcept { return m_depth; }

        void Enter() noexcept { ++m_depth; }

        void Leave() noexcept { --m_depth; }

    private:
        const Options& m_options;
        WireReader& m_reader;
        lap::core::UInt32 m_depth;
    };

    /**
     * @brief Scoped nesting level for struct, sequence and union bodies
     */
    template<typename Context>
    class DepthGuard final
    {
    public:
        explicit DepthGuard(Context& context) noexcept
            : m_context(context)
        {
            m_context.Enter();
        }

        ~DepthGuard() noexcept
        {
            m_context.Leave();
        }

        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

        bool Exceeded() const noexcept
        {
            return m_context.GetDepth() > m_context.GetOptions().GetMaxDepth();
        }

    private:
        Context& m_context;
    };

    /**
     * @brief Policy category of a type's length field
     */
    LengthFieldCategory CategoryOf(TypeKind kind) noexcept;

    /**
     * @brief Width of the length field preceding a value
     * @details Member override, then type override, then the policy default. Structs
     *          and unions at the top of a call, and non-TLV structs/unions nested
     *          outside a TLV struct, carry no length field unless overridden.
     * @return Width in {0,1,2,4} or kInvalidLengthFieldWidth when a dynamically sized
     *         value would need a length field of width 0
     */
    Result<lap::core::UInt8> ResolveLengthFieldWidth(const SchemaType& type,
                                                     const Placement& placement,
                                                     const Options& options) noexcept;

    /**
     * @brief Wire type of a TLV member as configured
     */
    Result<WireType> ResolveWireType(const SchemaType& type,
                                     const Placement& placement,
                                     const Options& options) noexcept;

} // namespace serialization
} // namespace someip
} // namespace lap

#endif // LAP_SOMEIP_CODEC_CONTEXT_HPP
