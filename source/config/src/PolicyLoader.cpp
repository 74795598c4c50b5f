/**
 * @file        PolicyLoader.cpp
 * @author      LightAP Development Team
 * @brief       YAML policy loader implementation
 * @date        2025-12-02
 * @copyright   Copyright (c) 2025
 */

#include "PolicyLoader.hpp"

#include <yaml-cpp/yaml.h>

namespace lap
{
namespace someip
{
namespace config
{
    using serialization::ByteOrder;
    using serialization::LengthSelection;
    using serialization::Options;
    using serialization::OptionsConfig;
    using serialization::StringEncoding;
    using serialization::TooMuchDataAction;
    using serialization::WireTypeCheck;

    namespace
    {
        Result<Options> InvalidValue(const char* key, const std::string& value) noexcept
        {
            LAP_SOMEIP_LOG_ERROR << "PolicyLoader: invalid value '" << value << "' for " << key;
            return Result<Options>::FromError(MakeErrorCode(SomeIpErrc::kInvalidOptions));
        }

        Result<lap::core::UInt8> ReadWidth(const YAML::Node& node, lap::core::UInt8 fallback)
        {
            if (!node)
            {
                return Result<lap::core::UInt8>::FromValue(fallback);
            }

            lap::core::UInt32 width = node.as<lap::core::UInt32>();
            if (width > 0xFF)
            {
                return Result<lap::core::UInt8>::FromError(MakeErrorCode(SomeIpErrc::kInvalidLengthFieldWidth, width));
            }
            return Result<lap::core::UInt8>::FromValue(static_cast<lap::core::UInt8>(width));
        }

        Result<Options> ParsePolicy(const YAML::Node& root)
        {
            OptionsConfig config;

            YAML::Node policy = root["policy"];
            if (!policy)
            {
                LAP_SOMEIP_LOG_WARN << "PolicyLoader: no 'policy' section, using reference defaults";
                return Options::Create(config);
            }

            std::string byteOrder = policy["byte_order"].as<std::string>("big");
            if (byteOrder == "big")
            {
                config.byteOrder = ByteOrder::kBigEndian;
            }
            else if (byteOrder == "little")
            {
                config.byteOrder = ByteOrder::kLittleEndian;
            }
            else
            {
                return InvalidValue("byte_order", byteOrder);
            }

            std::string encoding = policy["string_encoding"].as<std::string>("utf8");
            if (encoding == "utf8")
            {
                config.stringEncoding = StringEncoding::kUtf8;
            }
            else if (encoding == "utf16be")
            {
                config.stringEncoding = StringEncoding::kUtf16BE;
            }
            else if (encoding == "utf16le")
            {
                config.stringEncoding = StringEncoding::kUtf16LE;
            }
            else if (encoding == "ascii")
            {
                config.stringEncoding = StringEncoding::kAscii;
            }
            else
            {
                return InvalidValue("string_encoding", encoding);
            }

            config.stringWithBom = policy["string_bom"].as<bool>(false);
            config.stringWithTerminator = policy["string_terminator"].as<bool>(false);

            YAML::Node lengths = policy["length_fields"];
            if (lengths)
            {
                struct
                {
                    const char* key;
                    lap::core::UInt8* target;
                } widths[] = {
                    {"array", &config.arrayLengthWidth},
                    {"string", &config.stringLengthWidth},
                    {"struct", &config.structLengthWidth},
                    {"union", &config.unionLengthWidth}
                };

                for (auto& entry : widths)
                {
                    auto width = ReadWidth(lengths[entry.key], *entry.target);
                    if (!width.HasValue())
                    {
                        return Result<Options>::FromError(width.Error());
                    }
                    *entry.target = width.Value();
                }
            }

            auto selector = ReadWidth(policy["union_selector_width"], config.unionSelectorWidth);
            if (!selector.HasValue())
            {
                return Result<Options>::FromError(selector.Error());
            }
            config.unionSelectorWidth = selector.Value();

            std::string selection = policy["tlv_length_selection"].as<std::string>("configured");
            if (selection == "configured")
            {
                config.tlvLengthSelection = LengthSelection::kConfigured;
            }
            else if (selection == "smallest")
            {
                config.tlvLengthSelection = LengthSelection::kSmallest;
            }
            else
            {
                return InvalidValue("tlv_length_selection", selection);
            }

            std::string check = policy["wire_type_check"].as<std::string>("strict");
            if (check == "strict")
            {
                config.wireTypeCheck = WireTypeCheck::kStrict;
            }
            else if (check == "lenient")
            {
                config.wireTypeCheck = WireTypeCheck::kLenient;
            }
            else
            {
                return InvalidValue("wire_type_check", check);
            }

            std::string tooMuchData = policy["too_much_data"].as<std::string>("fail");
            if (tooMuchData == "fail")
            {
                config.tooMuchData = TooMuchDataAction::kFail;
            }
            else if (tooMuchData == "discard")
            {
                config.tooMuchData = TooMuchDataAction::kDiscard;
            }
            else if (tooMuchData == "keep")
            {
                config.tooMuchData = TooMuchDataAction::kKeep;
            }
            else
            {
                return InvalidValue("too_much_data", tooMuchData);
            }

            config.maxDepth = policy["max_depth"].as<lap::core::UInt32>(serialization::kDefaultMaxDepth);

            return Options::Create(config);
        }

        template<typename Loader>
        Result<Options> Load(const char* source, Loader&& loader) noexcept
        {
            try
            {
                YAML::Node root = loader();
                auto result = ParsePolicy(root);
                if (result.HasValue())
                {
                    LAP_SOMEIP_LOG_INFO << "PolicyLoader: loaded policy from " << source;
                }
                return result;
            }
            catch (const YAML::Exception& e)
            {
                LAP_SOMEIP_LOG_ERROR << "PolicyLoader: YAML parsing error in " << source << ": " << e.what();
                return Result<Options>::FromError(MakeErrorCode(SomeIpErrc::kConfigLoadFailed));
            }
            catch (const std::exception& e)
            {
                LAP_SOMEIP_LOG_ERROR << "PolicyLoader: configuration error in " << source << ": " << e.what();
                return Result<Options>::FromError(MakeErrorCode(SomeIpErrc::kConfigLoadFailed));
            }
        }
    } // namespace

    Result<Options> PolicyLoader::LoadFile(const String& path) noexcept
    {
        return Load(path.c_str(), [&path]() { return YAML::LoadFile(path.c_str()); });
    }

    Result<Options> PolicyLoader::LoadString(const String& document) noexcept
    {
        return Load("<string>", [&document]() { return YAML::Load(document.c_str()); });
    }

} // namespace config
} // namespace someip
} // namespace lap
