/**
 * @file        SchemaLoader.cpp
 * @author      LightAP Development Team
 * @brief       YAML schema loader implementation
 * @date        2025-12-02
 * @copyright   Copyright (c) 2025
 */

#include "SchemaLoader.hpp"
#include "WireTag.hpp"

#include <yaml-cpp/yaml.h>

namespace lap
{
namespace someip
{
namespace config
{
    using serialization::PrimitiveKind;
    using serialization::SchemaField;
    using serialization::SchemaType;
    using serialization::SchemaTypePtr;
    using serialization::SequenceBounds;
    using serialization::StringBounds;
    using serialization::UnionVariant;

    // ========================================================================
    // SchemaRegistry
    // ========================================================================

    Result<void> SchemaRegistry::Add(const String& name, SchemaTypePtr type) noexcept
    {
        if (!type)
        {
            return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kNullType));
        }
        if (Contains(name))
        {
            LAP_SOMEIP_LOG_ERROR << "SchemaRegistry: type '" << name.c_str() << "' declared twice";
            return Result<void>::FromError(MakeErrorCode(SomeIpErrc::kDuplicateFieldName));
        }

        m_types.emplace(name, std::move(type));
        m_names.push_back(name);
        return Result<void>::FromValue();
    }

    Result<SchemaTypePtr> SchemaRegistry::Find(const String& name) const noexcept
    {
        auto it = m_types.find(name);
        if (it == m_types.end())
        {
            return Result<SchemaTypePtr>::FromError(MakeErrorCode(SomeIpErrc::kUnknownTypeReference));
        }
        return Result<SchemaTypePtr>::FromValue(it->second);
    }

    // ========================================================================
    // SchemaLoader
    // ========================================================================

    namespace
    {
        Optional<lap::core::UInt8> ReadWidth(const YAML::Node& node)
        {
            if (!node)
            {
                return Optional<lap::core::UInt8>();
            }
            // Out-of-range widths are mapped to an invalid width and rejected by the factories
            lap::core::UInt32 width = node.as<lap::core::UInt32>();
            return Optional<lap::core::UInt8>(static_cast<lap::core::UInt8>(width > 0xFF ? 3 : width));
        }

        /**
         * @brief Recursive type parser bound to the registry being filled
         */
        class TypeParser final
        {
        public:
            explicit TypeParser(const SchemaRegistry& registry)
                : m_registry(registry)
            {}

            Result<SchemaTypePtr> ParseReference(const YAML::Node& node, const std::string& context)
            {
                if (node && node.IsMap())
                {
                    return ParseDefinition(node, context + "<inline>");
                }
                if (!node || !node.IsScalar())
                {
                    LAP_SOMEIP_LOG_ERROR << "SchemaLoader: " << context << " has no type";
                    return Result<SchemaTypePtr>::FromError(MakeErrorCode(SomeIpErrc::kNullType));
                }

                String name(node.as<std::string>().c_str());
                auto primitive = serialization::ParsePrimitiveKind(name);
                if (primitive.has_value())
                {
                    return SchemaType::CreatePrimitive(primitive.value());
                }
                if (name == "string")
                {
                    return SchemaType::CreateString();
                }

                auto named = m_registry.Find(name);
                if (!named.HasValue())
                {
                    LAP_SOMEIP_LOG_ERROR << "SchemaLoader: " << context << " refers to unknown type '"
                                         << name.c_str() << "'";
                }
                return named;
            }

            Result<SchemaTypePtr> ParseDefinition(const YAML::Node& node, const std::string& name)
            {
                std::string kind = node["kind"].as<std::string>("");
                Optional<lap::core::UInt8> width = ReadWidth(node["length_field"]);

                if (kind == "struct")
                {
                    return ParseStruct(node, name, width);
                }
                if (kind == "sequence")
                {
                    SequenceBounds bounds;
                    bounds.minElements = node["min_elements"].as<lap::core::UInt32>(bounds.minElements);
                    bounds.maxElements = node["max_elements"].as<lap::core::UInt32>(bounds.maxElements);

                    auto element = ParseReference(node["element"], name + ".element");
                    if (!element.HasValue())
                    {
                        return element;
                    }
                    return SchemaType::CreateSequence(element.Value(), bounds, width);
                }
                if (kind == "string")
                {
                    StringBounds bounds;
                    bounds.minSize = node["min_size"].as<lap::core::UInt32>(bounds.minSize);
                    bounds.maxSize = node["max_size"].as<lap::core::UInt32>(bounds.maxSize);
                    return SchemaType::CreateString(bounds, width);
                }
                if (kind == "union")
                {
                    return ParseUnion(node, name, width);
                }

                LAP_SOMEIP_LOG_ERROR << "SchemaLoader: type '" << name << "' has unknown kind '" << kind << "'";
                return Result<SchemaTypePtr>::FromError(MakeErrorCode(SomeIpErrc::kConfigLoadFailed));
            }

        private:
            Result<SchemaTypePtr> ParseStruct(const YAML::Node& node,
                                              const std::string& name,
                                              const Optional<lap::core::UInt8>& width)
            {
                lap::core::Vector<SchemaField> fields;

                YAML::Node fieldNodes = node["fields"];
                if (fieldNodes && fieldNodes.IsSequence())
                {
                    for (const auto& fieldNode : fieldNodes)
                    {
                        SchemaField field;
                        field.name = fieldNode["name"].as<std::string>("").c_str();

                        lap::core::UInt32 id = fieldNode["id"].as<lap::core::UInt32>();
                        if (id > serialization::kMaxDataId)
                        {
                            LAP_SOMEIP_LOG_ERROR << "SchemaLoader: " << name << "." << field.name.c_str()
                                                 << " id " << id << " exceeds 12 bits";
                            return Result<SchemaTypePtr>::FromError(MakeErrorCode(SomeIpErrc::kFieldIdOutOfRange, id));
                        }
                        field.id = static_cast<lap::core::UInt16>(id);
                        field.optional = fieldNode["optional"].as<bool>(false);
                        field.lengthFieldWidth = ReadWidth(fieldNode["length_field"]);

                        auto type = ParseReference(fieldNode["type"], name + "." + field.name.c_str());
                        if (!type.HasValue())
                        {
                            return type;
                        }
                        field.type = type.Value();
                        fields.push_back(field);
                    }
                }

                return SchemaType::CreateStruct(name.c_str(), std::move(fields), node["tlv"].as<bool>(false), width);
            }

            Result<SchemaTypePtr> ParseUnion(const YAML::Node& node,
                                             const std::string& name,
                                             const Optional<lap::core::UInt8>& width)
            {
                Optional<PrimitiveKind> treatAs;
                YAML::Node treatAsNode = node["treat_as"];
                if (treatAsNode)
                {
                    treatAs = serialization::ParsePrimitiveKind(treatAsNode.as<std::string>().c_str());
                    if (!treatAs.has_value())
                    {
                        LAP_SOMEIP_LOG_ERROR << "SchemaLoader: union '" << name << "' treat_as is not a primitive";
                        return Result<SchemaTypePtr>::FromError(MakeErrorCode(SomeIpErrc::kInvalidTreatAs));
                    }
                }

                lap::core::Vector<UnionVariant> variants;
                YAML::Node variantNodes = node["variants"];
                if (variantNodes && variantNodes.IsSequence())
                {
                    lap::core::UInt32 index = 0;
                    for (const auto& variantNode : variantNodes)
                    {
                        UnionVariant variant;
                        variant.name = variantNode["name"].as<std::string>("").c_str();
                        variant.discriminant = variantNode["discriminant"].as<lap::core::UInt32>(index);
                        if (variantNode["value"])
                        {
                            variant.treatAsValue = Optional<lap::core::Int64>(variantNode["value"].as<lap::core::Int64>());
                        }
                        if (variantNode["type"])
                        {
                            auto payload = ParseReference(variantNode["type"], name + "." + variant.name.c_str());
                            if (!payload.HasValue())
                            {
                                return payload;
                            }
                            variant.payload = payload.Value();
                        }
                        variants.push_back(variant);
                        ++index;
                    }
                }

                return SchemaType::CreateUnion(name.c_str(), std::move(variants), treatAs, width);
            }

            const SchemaRegistry& m_registry;
        };

        Result<SchemaRegistry> ParseDocument(const YAML::Node& root)
        {
            SchemaRegistry registry;
            TypeParser parser(registry);

            YAML::Node types = root["types"];
            if (!types || !types.IsSequence())
            {
                LAP_SOMEIP_LOG_ERROR << "SchemaLoader: document has no 'types' sequence";
                return Result<SchemaRegistry>::FromError(MakeErrorCode(SomeIpErrc::kConfigLoadFailed));
            }

            for (const auto& node : types)
            {
                std::string name = node["name"].as<std::string>("");
                if (name.empty())
                {
                    LAP_SOMEIP_LOG_ERROR << "SchemaLoader: type without name";
                    return Result<SchemaRegistry>::FromError(MakeErrorCode(SomeIpErrc::kConfigLoadFailed));
                }

                auto type = parser.ParseDefinition(node, name);
                if (!type.HasValue())
                {
                    return Result<SchemaRegistry>::FromError(type.Error());
                }

                auto added = registry.Add(name.c_str(), type.Value());
                if (!added.HasValue())
                {
                    return Result<SchemaRegistry>::FromError(added.Error());
                }
                LAP_SOMEIP_LOG_DEBUG << "SchemaLoader: registered " << name;
            }
            return Result<SchemaRegistry>::FromValue(std::move(registry));
        }

        template<typename Loader>
        Result<SchemaRegistry> Load(const char* source, Loader&& loader) noexcept
        {
            try
            {
                YAML::Node root = loader();
                auto result = ParseDocument(root);
                if (result.HasValue())
                {
                    LAP_SOMEIP_LOG_INFO << "SchemaLoader: loaded " << result.Value().Size() << " types from " << source;
                }
                return result;
            }
            catch (const YAML::Exception& e)
            {
                LAP_SOMEIP_LOG_ERROR << "SchemaLoader: YAML parsing error in " << source << ": " << e.what();
                return Result<SchemaRegistry>::FromError(MakeErrorCode(SomeIpErrc::kConfigLoadFailed));
            }
            catch (const std::exception& e)
            {
                LAP_SOMEIP_LOG_ERROR << "SchemaLoader: configuration error in " << source << ": " << e.what();
                return Result<SchemaRegistry>::FromError(MakeErrorCode(SomeIpErrc::kConfigLoadFailed));
            }
        }
    } // namespace

    Result<SchemaRegistry> SchemaLoader::LoadFile(const String& path) noexcept
    {
        return Load(path.c_str(), [&path]() { return YAML::LoadFile(path.c_str()); });
    }

    Result<SchemaRegistry> SchemaLoader::LoadString(const String& document) noexcept
    {
        return Load("<string>", [&document]() { return YAML::Load(document.c_str()); });
    }

} // namespace config
} // namespace someip
} // namespace lap
