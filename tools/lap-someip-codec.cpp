/**
 * @file        lap-someip-codec.cpp
 * @author      LightAP Development Team
 * @brief       Command line decoder for SOME/IP payloads
 * @date        2025-12-02
 * @details     Decodes a hex payload against a named type from a schema file, or lists
 *              the raw tag entries of a TLV payload.
 * @copyright   Copyright (c) 2025
 * @usage       lap-someip-codec --schema=types.yaml --type=Point --hex=200000000001200100000002
 *              lap-someip-codec --tags --hex=200000000001200100000002
 */

#include "lap_someip.hpp"

#include <iostream>
#include <iomanip>
#include <cstdlib>
#include <cstring>
#include <cctype>
#include <cstdio>

using namespace lap::someip;
using namespace lap::someip::serialization;
using lap::core::String;

// Parse command-line arguments
struct Config
{
    String policy_path;
    String schema_path;
    String type_name;
    String hex;
    bool list_tags = false;
};

bool parse_args(int argc, char** argv, Config& config)
{
    for (int i = 1; i < argc; ++i)
    {
        const char* arg = argv[i];

        if (strncmp(arg, "--policy=", 9) == 0)
        {
            config.policy_path = arg + 9;
        }
        else if (strncmp(arg, "--schema=", 9) == 0)
        {
            config.schema_path = arg + 9;
        }
        else if (strncmp(arg, "--type=", 7) == 0)
        {
            config.type_name = arg + 7;
        }
        else if (strncmp(arg, "--hex=", 6) == 0)
        {
            config.hex = arg + 6;
        }
        else if (strcmp(arg, "--tags") == 0)
        {
            config.list_tags = true;
        }
        else if (strcmp(arg, "--help") == 0 || strcmp(arg, "-h") == 0)
        {
            std::cout << "Usage: " << argv[0] << " [options]\n"
                      << "Options:\n"
                      << "  --policy=<file>         Policy YAML (default: reference policy)\n"
                      << "  --schema=<file>         Schema YAML with named types\n"
                      << "  --type=<name>           Type to decode the payload as\n"
                      << "  --hex=<bytes>           Payload as hex digits, spaces allowed\n"
                      << "  --tags                  List TLV tag entries instead of decoding\n"
                      << "  --help, -h              Show this help message\n"
                      << "\n"
                      << "Example:\n"
                      << "  " << argv[0] << " --schema=types.yaml --type=Point --hex=200000000001\n"
                      << std::endl;
            return false;
        }
        else
        {
            LAP_SOMEIP_LOG_ERROR << "Unknown argument: " << arg;
            return false;
        }
    }

    if (config.hex.empty())
    {
        LAP_SOMEIP_LOG_ERROR << "Missing --hex payload";
        return false;
    }
    if (!config.list_tags && (config.schema_path.empty() || config.type_name.empty()))
    {
        LAP_SOMEIP_LOG_ERROR << "Decoding needs --schema and --type";
        return false;
    }
    return true;
}

// Print an error message to stderr
void print_error(const char* what, const lap::core::ErrorCode& error)
{
    auto sv = error.Message();
    std::fprintf(stderr, "%s: %.*s (code 0x%x)\n", what, static_cast<int>(sv.size()), sv.data(),
                 static_cast<unsigned int>(error.Value()));
}

// Convert hex digits (whitespace ignored) to bytes
bool parse_hex(const String& text, ByteBuffer& bytes)
{
    int high = -1;
    for (char c : text)
    {
        if (std::isspace(static_cast<unsigned char>(c)))
        {
            continue;
        }
        if (!std::isxdigit(static_cast<unsigned char>(c)))
        {
            return false;
        }

        int nibble = std::isdigit(static_cast<unsigned char>(c))
                   ? c - '0'
                   : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
        if (high < 0)
        {
            high = nibble;
        }
        else
        {
            bytes.push_back(static_cast<lap::core::UInt8>((high << 4) | nibble));
            high = -1;
        }
    }
    return high < 0;
}

int list_tags(const ByteBuffer& payload)
{
    auto entries = ScanTlvEntries(ByteView(payload.data(), payload.size()));
    if (!entries.HasValue())
    {
        print_error("Scan failed", entries.Error());
        return EXIT_FAILURE;
    }

    for (const auto& entry : entries.Value())
    {
        std::cout << "offset=" << entry.offset
                  << " id=0x" << std::hex << std::setw(3) << std::setfill('0') << entry.tag.dataId
                  << std::dec << std::setfill(' ')
                  << " wire_type=" << ToString(entry.tag.wireType)
                  << " size=" << entry.valueSize << "\n";
    }
    return EXIT_SUCCESS;
}

int main(int argc, char** argv)
{
    Config config;
    if (!parse_args(argc, argv, config))
    {
        return EXIT_FAILURE;
    }

    ByteBuffer payload;
    if (!parse_hex(config.hex, payload))
    {
        LAP_SOMEIP_LOG_ERROR << "Invalid hex payload";
        return EXIT_FAILURE;
    }

    if (config.list_tags)
    {
        return list_tags(payload);
    }

    Options options = Options::Reference();
    if (!config.policy_path.empty())
    {
        auto policy = lap::someip::config::PolicyLoader::LoadFile(config.policy_path);
        if (!policy.HasValue())
        {
            print_error("Failed to load policy", policy.Error());
            return EXIT_FAILURE;
        }
        options = policy.Value();
    }

    auto registry = lap::someip::config::SchemaLoader::LoadFile(config.schema_path);
    if (!registry.HasValue())
    {
        print_error("Failed to load schema", registry.Error());
        return EXIT_FAILURE;
    }

    auto type = registry.Value().Find(config.type_name);
    if (!type.HasValue())
    {
        std::cerr << "Unknown type: " << config.type_name << std::endl;
        return EXIT_FAILURE;
    }

    auto value = Decode(ByteView(payload.data(), payload.size()), *type.Value(), options);
    if (!value.HasValue())
    {
        print_error("Decode failed", value.Error());
        return EXIT_FAILURE;
    }

    std::cout << FormatValue(value.Value()) << std::endl;
    return EXIT_SUCCESS;
}
