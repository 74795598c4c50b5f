/**
 * @file        Serializer.cpp
 * @author      LightAP Development Team
 * @brief       Stateless encode/decode entry points
 * @date        2025-12-02
 * @copyright   Copyright (c) 2025
 */

#include "Serializer.hpp"
#include "ValueCodec.hpp"

namespace lap
{
namespace someip
{
namespace serialization
{
    Result<ByteBuffer> Encode(const Value& value, const SchemaType& schema, const Options& options) noexcept
    {
        ByteBuffer buffer;
        auto result = EncodeInto(value, schema, options, buffer);
        if (!result.HasValue())
        {
            return Result<ByteBuffer>::FromError(result.Error());
        }
        return Result<ByteBuffer>::FromValue(std::move(buffer));
    }

    Result<void> EncodeInto(const Value& value,
                            const SchemaType& schema,
                            const Options& options,
                            ByteBuffer& buffer) noexcept
    {
        lap::core::Size start = buffer.size();
        WireWriter writer(buffer);
        EncodeContext context(options, writer);

        auto result = ValueCodec::Encode(context, schema, value, Placement::TopLevel());
        if (!result.HasValue())
        {
            LAP_SOMEIP_LOG_DEBUG << "Encode " << schema.GetName().c_str() << " failed: "
                                 << result.Error().Message();
            buffer.resize(start);
            return result;
        }

        LAP_SOMEIP_LOG_VERBOSE << "Encode " << schema.GetName().c_str() << ": " << (buffer.size() - start) << " bytes";
        return Result<void>::FromValue();
    }

    Result<Value> Decode(ByteView bytes, const SchemaType& schema, const Options& options) noexcept
    {
        WireReader reader(bytes);
        DecodeContext context(options, reader);

        auto value = ValueCodec::Decode(context, schema, Placement::TopLevel());
        if (!value.HasValue())
        {
            LAP_SOMEIP_LOG_DEBUG << "Decode " << schema.GetName().c_str() << " failed at offset "
                                 << reader.Position() << ": " << value.Error().Message();
            return value;
        }

        if (!reader.AtEnd())
        {
            LAP_SOMEIP_LOG_DEBUG << "Decode " << schema.GetName().c_str() << ": " << reader.Remaining()
                                 << " trailing bytes";
            return Result<Value>::FromError(MakeErrorCode(SomeIpErrc::kLengthMismatch,
                static_cast<lap::core::ErrorDomain::SupportDataType>(reader.Position())));
        }
        return value;
    }

    Result<lap::core::Vector<TlvEntry>> ScanTlvEntries(ByteView bytes) noexcept
    {
        using EntryList = lap::core::Vector<TlvEntry>;

        WireReader reader(bytes);
        EntryList entries;

        while (!reader.AtEnd())
        {
            TlvEntry entry;
            entry.offset = reader.Position();

            auto raw = reader.ReadInteger<lap::core::UInt16>(ByteOrder::kBigEndian);
            if (!raw.HasValue())
            {
                return Result<EntryList>::FromError(raw.Error());
            }
            auto tag = WireTag::Unpack(static_cast<lap::core::UInt8>(raw.Value() >> 8),
                                       static_cast<lap::core::UInt8>(raw.Value() & 0xFF));
            if (!tag.HasValue())
            {
                return Result<EntryList>::FromError(tag.Error());
            }
            entry.tag = tag.Value();

            if (IsLengthDelimited(entry.tag.wireType))
            {
                auto length = reader.ReadLength(LengthFieldWidthOf(entry.tag.wireType));
                if (!length.HasValue())
                {
                    return Result<EntryList>::FromError(length.Error());
                }
                entry.valueSize = static_cast<lap::core::Size>(length.Value());
            }
            else if (entry.tag.wireType == WireType::kComplex)
            {
                return Result<EntryList>::FromError(MakeErrorCode(SomeIpErrc::kUnsupportedWireType,
                                                                  entry.tag.dataId));
            }
            else
            {
                entry.valueSize = FixedSizeOf(entry.tag.wireType);
            }

            auto skipped = reader.Skip(entry.valueSize);
            if (!skipped.HasValue())
            {
                return Result<EntryList>::FromError(skipped.Error());
            }
            entries.push_back(entry);
        }
        return Result<EntryList>::FromValue(std::move(entries));
    }

} // namespace serialization
} // namespace someip
} // namespace lap
