#ifndef CAMSIM_CONFIG_HPP_
#define CAMSIM_CONFIG_HPP_

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
 * @file config.hpp
 * @brief Configuration public API for camsim.
 */

#include <engine/build_definitions.hpp>
#include <engine/linkable.hpp>
#include <utils/logging.hpp>
#include <utils/map.hpp>
#include <vector>
#include <yaml/yaml_parser.hpp>

/**
 * @brief Don't call, used by the engine when building itself.
 * @details Allocates a default component by it's class name.
 */
Linkable* CreateDefaultComponentByClass(const char* name);

/**
 * @brief What a component sees of its configuration.
 * @details Every accessor returns non-zero on error, after printing the
 * location of the offending parameter. A parameter that isn't present leaves
 * the output untouched, so callers initialize it with the default first.
 */
class Config {
  private:
    Map<yaml::YamlValue>* config;
    std::vector<Linkable*>* components;
    Map<Linkable*>* aliases;
    Map<Definition>* definitions;
    yaml::YamlLocation location;

    inline void RequiredParameterNotPassed(const char* const parameter) {
        CAMSIM_ERROR_PRINTF("%s:%lu:%lu Required parameter not passed: %s.\n",
                            this->location.file, this->location.line,
                            this->location.column, parameter);
    }

    int GetValue(const char* parameter, bool required, yaml::YamlValue** ret);
    void NotA(const char* what, const char* parameter,
              const yaml::YamlValue* value);

    Linkable* GetComponentByMapping(Map<yaml::YamlValue>* mapping,
                                    yaml::YamlLocation location);
    Linkable* GetComponentByAlias(const char* alias,
                                  yaml::YamlLocation location);
    Linkable* GetComponentByString(const char* string,
                                   yaml::YamlLocation location);
    Linkable* GetComponentFromYaml(yaml::YamlValue* yaml);

  public:
    inline Config(std::vector<Linkable*>* components, Map<Linkable*>* aliases,
                  Map<Definition>* definitions, Map<yaml::YamlValue>* config,
                  yaml::YamlLocation location)
        : config(config),
          components(components),
          aliases(aliases),
          definitions(definitions),
          location(location) {}

    /**
     * @brief Gets another component. The parameter may be an alias
     * (`*name`), the name of a root definition (instantiated on the spot), or
     * an inline mapping with a `class` key.
     */
    template <typename ComponentType>
    int ComponentReference(const char* parameter, ComponentType** ret,
                           bool required = false) {
        yaml::YamlValue* value;
        if (this->GetValue(parameter, required, &value)) return 1;
        if (value == NULL) return 0;

        Linkable* component = this->GetComponentFromYaml(value);
        if (component == NULL) return 1;

        *ret = dynamic_cast<ComponentType*>(component);
        if (*ret == NULL) {
            CAMSIM_ERROR_PRINTF(
                "%s:%lu:%lu Component %s has the wrong message type.\n",
                value->location.file, value->location.line,
                value->location.column, parameter);
            return 1;
        }
        return 0;
    }

    int Bool(const char* parameter, bool* ret, bool required = false);
    int Integer(const char* parameter, long* ret, bool required = false);
    int Floating(const char* parameter, double* ret, bool required = false);
    int String(const char* parameter, const char** ret, bool required = false);

    /**
     * @brief Prints an error about a parameter. Always returns 1 so it can be
     * returned directly.
     */
    int Error(const char* parameter, const char* reason);

    /**
     * @brief A Config for a nested mapping.
     * @returns Non-zero if the parameter is present but not a mapping. When
     * it's absent ret points to an empty configuration.
     */
    int Fork(const char* parameter, Config* ret);

    /** @brief Only use if you know what you're doing. */
    Map<yaml::YamlValue>* RawYaml() { return this->config; }
};

/**
 * @brief Creates a "fake" configuration for testing a component.
 * @param parser It's lifetime is the lifetime of the configuration itself, so
 * the caller should pass one.
 * @param content The content.
 * @param aliases An aliases mapping. Referencing components by anything but
 * an alias is an error in a fake configuration.
 */
Config CreateFakeConfig(yaml::Parser* parser, const char* content,
                        Map<Linkable*>* aliases);

#ifndef NDEBUG
int TestConfig();
#endif

#endif  // CAMSIM_CONFIG_HPP_
