/**
 * @file        PolicyLoader.hpp
 * @author      LightAP Development Team
 * @brief       Load a serialization policy bundle from YAML
 * @date        2025-12-02
 * @details     Expected document layout (every key optional, defaults as Options::Reference()):
 *              <pre>
 *              policy:
 *                byte_order: big            # big | little
 *                string_encoding: utf8      # utf8 | utf16be | utf16le | ascii
 *                string_bom: false
 *                string_terminator: false
 *                length_fields: { array: 4, string: 4, struct: 4, union: 4 }
 *                union_selector_width: 4
 *                tlv_length_selection: configured   # configured | smallest
 *                wire_type_check: strict    # strict | lenient
 *                too_much_data: fail        # fail | discard | keep
 *                max_depth: 32
 *              </pre>
 * @copyright   Copyright (c) 2025
 * @version     1.0
 */
#ifndef LAP_SOMEIP_POLICY_LOADER_HPP
#define LAP_SOMEIP_POLICY_LOADER_HPP

#include "Options.hpp"

namespace lap
{
namespace someip
{
namespace config
{
    class PolicyLoader final
    {
    public:
        /**
         * @brief Load a policy from a YAML file
         * @return Options, kConfigLoadFailed for unreadable/malformed YAML, or the
         *         validation error of the policy values
         */
        static Result<serialization::Options> LoadFile(const String& path) noexcept;

        /**
         * @brief Load a policy from a YAML document held in memory
         */
        static Result<serialization::Options> LoadString(const String& document) noexcept;
    };

} // namespace config
} // namespace someip
} // namespace lap

#endif // LAP_SOMEIP_POLICY_LOADER_HPP
