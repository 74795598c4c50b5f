/**
 * @file        SchemaLoader.hpp
 * @author      LightAP Development Team
 * @brief       Load named type descriptions from YAML
 * @date        2025-12-02
 * @details     Expected document layout:
 *              <pre>
 *              types:
 *                - name: Point
 *                  kind: struct             # struct | sequence | string | union
 *                  tlv: true
 *                  length_field: 2          # optional type override
 *                  fields:
 *                    - { name: x, id: 0, type: int32 }
 *                    - { name: y, id: 1, type: int32, optional: true }
 *                - name: Points
 *                  kind: sequence
 *                  element: Point           # primitive, "string", earlier name or inline mapping
 *                  min_elements: 0
 *                  max_elements: 16
 *                - name: Mode
 *                  kind: union
 *                  treat_as: uint32         # optional
 *                  variants:
 *                    - { name: Off, discriminant: 0, value: 0 }
 *                    - { name: On, discriminant: 1, value: 7 }
 *              </pre>
 *              Types may only refer to primitives, "string", inline mappings or types
 *              declared earlier in the document.
 * @copyright   Copyright (c) 2025
 * @version     1.0
 */
#ifndef LAP_SOMEIP_SCHEMA_LOADER_HPP
#define LAP_SOMEIP_SCHEMA_LOADER_HPP

#include "Schema.hpp"

#include <map>

namespace lap
{
namespace someip
{
namespace config
{
    /**
     * @brief Named type descriptions, immutable once loaded
     */
    class SchemaRegistry final
    {
    public:
        /**
         * @brief Register a named type
         * @return kDuplicateFieldName if the name is taken, kNullType for an empty type
         */
        Result<void> Add(const String& name, serialization::SchemaTypePtr type) noexcept;

        /**
         * @brief Look up a named type
         * @return Type or kUnknownTypeReference
         */
        Result<serialization::SchemaTypePtr> Find(const String& name) const noexcept;

        bool Contains(const String& name) const noexcept { return m_types.find(name) != m_types.end(); }

        /// Names in registration order
        const lap::core::Vector<String>& GetNames() const noexcept { return m_names; }

        lap::core::Size Size() const noexcept { return m_names.size(); }

    private:
        std::map<String, serialization::SchemaTypePtr> m_types;
        lap::core::Vector<String> m_names;
    };

    class SchemaLoader final
    {
    public:
        /**
         * @brief Load type descriptions from a YAML file
         * @return Registry, kConfigLoadFailed for unreadable/malformed YAML,
         *         kUnknownTypeReference, or the schema error of the first invalid type
         */
        static Result<SchemaRegistry> LoadFile(const String& path) noexcept;

        /**
         * @brief Load type descriptions from a YAML document held in memory
         */
        static Result<SchemaRegistry> LoadString(const String& document) noexcept;
    };

} // namespace config
} // namespace someip
} // namespace lap

#endif // LAP_SOMEIP_SCHEMA_LOADER_HPP
