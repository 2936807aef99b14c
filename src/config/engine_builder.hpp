#ifndef CAMSIM_CONFIG_ENGINE_BUILDER_HPP_
#define CAMSIM_CONFIG_ENGINE_BUILDER_HPP_

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
 * @file engine_builder.hpp
 * @brief Public API of the EngineBuilder, that instantiates an Engine.
 * @details The EngineBuilder receives a configuration file (or string) and
 * instantiates an Engine with it's components. If there's an error, NULL is
 * returned. For a better understanding of the way the EngineBuilder
 * transforms YAML into components, read the implementation docs on
 * engine_builder.cpp.
 */

#include <config/config.hpp>
#include <engine/build_definitions.hpp>
#include <engine/engine.hpp>
#include <vector>
#include <yaml/yaml_parser.hpp>

class EngineBuilder {
  private:
    yaml::Parser parser;
    Map<Definition> definitions;
    Map<Linkable*> aliases;
    std::vector<Linkable*> components; /**< Every component created, until
                                          the engine takes them. */
    std::vector<InstanceWithDefinition> instances;

    int AddDefinition(const char* name, yaml::YamlValue* value);
    int ConfigureInstances();
    Engine* Build(yaml::YamlValue* root);

  public:
    /** @returns NULL on error, after printing it. */
    Engine* Instantiate(const char* configFile);
    /** @returns NULL on error, after printing it. */
    Engine* InstantiateFromString(const char* content);

    ~EngineBuilder();
};

#ifndef NDEBUG
int TestEngineBuilder();
int TestSimulation();
#endif

#endif  // CAMSIM_CONFIG_ENGINE_BUILDER_HPP_
