/**
 * @file        lap_someip.hpp
 * @author      LightAP Development Team
 * @brief       SOME/IP payload serialization public interface
 * @date        2025-12-02
 * @copyright   Copyright (c) 2025
 */
#ifndef LAP_SOMEIP_LAP_SOMEIP_HPP
#define LAP_SOMEIP_LAP_SOMEIP_HPP

#include "SomeIpTypes.hpp"
#include "Options.hpp"
#include "WireTag.hpp"
#include "Schema.hpp"
#include "Value.hpp"
#include "Serializer.hpp"
#include "PolicyLoader.hpp"
#include "SchemaLoader.hpp"

#endif // LAP_SOMEIP_LAP_SOMEIP_HPP
