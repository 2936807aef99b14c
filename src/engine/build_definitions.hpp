#ifndef CAMSIM_ENGINE_BUILD_DEFINITIONS_HPP_
#define CAMSIM_ENGINE_BUILD_DEFINITIONS_HPP_

//
// Copyright (C) 2025  HiPES - Universidade Federal do Paraná
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.
//

/**
 * @file build_definitions.hpp
 * @brief Types shared by the configuration layer and the engine builder.
 */

#include <yaml/yaml_parser.hpp>

// Pre-declaration because they include us.
class Linkable;

/** @brief A component definition: a root entry of the configuration. */
struct Definition {
    Map<yaml::YamlValue>* config;
    yaml::YamlLocation location;
};

/** @brief A component created from an anchored definition. */
struct InstanceWithDefinition {
    Linkable* component;
    Definition definition;
};

#endif  // CAMSIM_ENGINE_BUILD_DEFINITIONS_HPP_
