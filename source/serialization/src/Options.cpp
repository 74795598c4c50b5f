/**
 * @file        Options.cpp
 * @author      LightAP Development Team
 * @brief       Wire-format policy validation and reference bundles
 * @date        2025-12-02
 * @copyright   Copyright (c) 2025
 */

#include "Options.hpp"

namespace lap
{
namespace someip
{
namespace serialization
{
    Result<Options> Options::Create(const OptionsConfig& config) noexcept
    {
        const lap::core::UInt8 widths[] = {
            config.arrayLengthWidth,
            config.stringLengthWidth,
            config.structLengthWidth,
            config.unionLengthWidth
        };

        for (auto width : widths)
        {
            if (!IsValidLengthFieldWidth(width))
            {
                LAP_SOMEIP_LOG_ERROR << "Options: invalid default length field width " << static_cast<lap::core::UInt32>(width);
                return Result<Options>::FromError(MakeErrorCode(SomeIpErrc::kInvalidLengthFieldWidth, width));
            }
        }

        // A union selector always exists on the wire, width 0 is meaningless here
        if (config.unionSelectorWidth == 0 || !IsValidLengthFieldWidth(config.unionSelectorWidth))
        {
            LAP_SOMEIP_LOG_ERROR << "Options: invalid union selector width "
                                 << static_cast<lap::core::UInt32>(config.unionSelectorWidth);
            return Result<Options>::FromError(MakeErrorCode(SomeIpErrc::kInvalidLengthFieldWidth,
                                                            config.unionSelectorWidth));
        }

        if (config.stringEncoding == StringEncoding::kAscii && config.stringWithBom)
        {
            LAP_SOMEIP_LOG_ERROR << "Options: ASCII strings cannot carry a byte order mark";
            return Result<Options>::FromError(MakeErrorCode(SomeIpErrc::kInvalidOptions));
        }

        if (config.maxDepth == 0 || config.maxDepth > kMaxDepthLimit)
        {
            LAP_SOMEIP_LOG_ERROR << "Options: max depth " << config.maxDepth << " out of range";
            return Result<Options>::FromError(MakeErrorCode(SomeIpErrc::kInvalidOptions, config.maxDepth));
        }

        return Result<Options>::FromValue(Options(config));
    }

    const Options& Options::Reference() noexcept
    {
        static const Options reference{OptionsConfig{}};
        return reference;
    }

    const Options& Options::Autosar() noexcept
    {
        static const Options autosar = []() {
            OptionsConfig config;
            config.stringWithBom = true;
            config.stringWithTerminator = true;
            return Options(config);
        }();
        return autosar;
    }

    lap::core::UInt8 Options::GetLengthFieldWidth(LengthFieldCategory category) const noexcept
    {
        switch (category)
        {
            case LengthFieldCategory::kArray:
                return m_config.arrayLengthWidth;
            case LengthFieldCategory::kString:
                return m_config.stringLengthWidth;
            case LengthFieldCategory::kStruct:
                return m_config.structLengthWidth;
            case LengthFieldCategory::kUnion:
                return m_config.unionLengthWidth;
        }
        return m_config.structLengthWidth;
    }

    const char* ToString(ByteOrder order) noexcept
    {
        return order == ByteOrder::kBigEndian ? "big" : "little";
    }

    const char* ToString(StringEncoding encoding) noexcept
    {
        switch (encoding)
        {
            case StringEncoding::kUtf8:
                return "utf8";
            case StringEncoding::kUtf16BE:
                return "utf16be";
            case StringEncoding::kUtf16LE:
                return "utf16le";
            case StringEncoding::kAscii:
                return "ascii";
        }
        return "unknown";
    }

    const char* ToString(TooMuchDataAction action) noexcept
    {
        switch (action)
        {
            case TooMuchDataAction::kFail:
                return "fail";
            case TooMuchDataAction::kDiscard:
                return "discard";
            case TooMuchDataAction::kKeep:
                return "keep";
        }
        return "unknown";
    }

} // namespace serialization
} // namespace someip
} // namespace lap
