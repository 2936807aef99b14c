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
 * @file config.cpp
 * @brief Implementation of the configuration accessors.
 */

#include "config.hpp"

#include <cstdio>
#include <cstring>

int Config::Error(const char* parameter, const char* reason) {
    yaml::YamlLocation location = this->location;
    if (this->config != NULL) {
        yaml::YamlValue* value = this->config->Get(parameter);
        if (value != NULL) location = value->location;
    }
    CAMSIM_ERROR_PRINTF("%s:%lu:%lu %s: %s\n", location.file, location.line,
                        location.column, parameter, reason);
    return 1;
}

int Config::GetValue(const char* parameter, bool required,
                     yaml::YamlValue** ret) {
    *ret = NULL;
    if (this->config != NULL) {
        yaml::YamlValue* value = this->config->Get(parameter);
        *ret = value;
        if (value != NULL) return 0;
    }

    if (!required) return 0;
    this->RequiredParameterNotPassed(parameter);
    return 1;
}

void Config::NotA(const char* what, const char* parameter,
                  const yaml::YamlValue* value) {
    CAMSIM_ERROR_PRINTF("%s:%lu:%lu Parameter is not %s: %s.\n",
                        value->location.file, value->location.line,
                        value->location.column, what, parameter);
}

int Config::Bool(const char* parameter, bool* ret, bool required) {
    yaml::YamlValue* value;
    if (this->GetValue(parameter, required, &value)) return 1;
    if (value == NULL) return 0;

    if (value->type == yaml::YamlValueTypeString) {
        if (!strcmp(value->value.string, "true") ||
            !strcmp(value->value.string, "yes") ||
            !strcmp(value->value.string, "1")) {
            *ret = true;
            return 0;
        } else if (!strcmp(value->value.string, "false") ||
                   !strcmp(value->value.string, "no") ||
                   !strcmp(value->value.string, "0")) {
            *ret = false;
            return 0;
        }
    }

    this->NotA("a boolean", parameter, value);
    return 1;
}

int Config::Integer(const char* parameter, long* ret, bool required) {
    yaml::YamlValue* value;
    if (this->GetValue(parameter, required, &value)) return 1;
    if (value == NULL) return 0;

    // Hexadecimal is handy for addresses.
    char trailing;
    if (value->type == yaml::YamlValueTypeString &&
        sscanf(value->value.string, "%li%c", ret, &trailing) == 1)
        return 0;

    this->NotA("an integer", parameter, value);
    return 1;
}

int Config::Floating(const char* parameter, double* ret, bool required) {
    yaml::YamlValue* value;
    if (this->GetValue(parameter, required, &value)) return 1;
    if (value == NULL) return 0;

    char trailing;
    if (value->type == yaml::YamlValueTypeString &&
        sscanf(value->value.string, "%lf%c", ret, &trailing) == 1)
        return 0;

    this->NotA("a floating", parameter, value);
    return 1;
}

int Config::String(const char* parameter, const char** ret, bool required) {
    yaml::YamlValue* value;
    if (this->GetValue(parameter, required, &value)) return 1;
    if (value == NULL) return 0;

    if (value->type == yaml::YamlValueTypeString) {
        *ret = value->value.string;
        return 0;
    }

    this->NotA("a string", parameter, value);
    return 1;
}

int Config::Fork(const char* parameter, Config* ret) {
    yaml::YamlValue* value;
    if (this->GetValue(parameter, false, &value)) return 1;

    if (value == NULL) {
        *ret = Config(this->components, this->aliases, this->definitions, NULL,
                      this->location);
        return 0;
    }
    if (value->type != yaml::YamlValueTypeMapping) {
        this->NotA("a mapping", parameter, value);
        return 1;
    }

    *ret = Config(this->components, this->aliases, this->definitions,
                  value->value.mapping, value->location);
    return 0;
}

Linkable* Config::GetComponentFromYaml(yaml::YamlValue* yaml) {
    switch (yaml->type) {
        case yaml::YamlValueTypeString:
            return this->GetComponentByString(yaml->value.string,
                                              yaml->location);
        case yaml::YamlValueTypeAlias:
            return this->GetComponentByAlias(yaml->value.alias, yaml->location);
        case yaml::YamlValueTypeMapping:
            return this->GetComponentByMapping(yaml->value.mapping,
                                               yaml->location);
        default:
            CAMSIM_ERROR_PRINTF("%s:%lu:%lu Is not a component reference.\n",
                                yaml->location.file, yaml->location.line,
                                yaml->location.column);
            return NULL;
    }
}

Linkable* Config::GetComponentByAlias(const char* alias,
                                      yaml::YamlLocation location) {
    Linkable** component =
        this->aliases == NULL ? NULL : this->aliases->Get(alias);
    if (component == NULL) {
        CAMSIM_ERROR_PRINTF("%s:%lu:%lu No such component alias: %s.\n",
                            location.file, location.line, location.column,
                            alias);
        return NULL;
    }
    return *component;
}

Linkable* Config::GetComponentByMapping(Map<yaml::YamlValue>* config,
                                        yaml::YamlLocation location) {
    if (this->components == NULL) {
        CAMSIM_ERROR_PRINTF(
            "%s:%lu:%lu Components can't be created from here.\n",
            location.file, location.line, location.column);
        return NULL;
    }

    yaml::YamlValue* clazzYaml = config->Get("class");
    if (clazzYaml == NULL) {
        CAMSIM_ERROR_PRINTF("%s:%lu:%lu Component class not passed.\n",
                            location.file, location.line, location.column);
        return NULL;
    }
    if (clazzYaml->type != yaml::YamlValueTypeString) {
        CAMSIM_ERROR_PRINTF("%s:%lu:%lu Component class is not a string.\n",
                            clazzYaml->location.file, clazzYaml->location.line,
                            clazzYaml->location.column);
        return NULL;
    }
    const char* clazz = clazzYaml->value.string;

    Linkable* component = CreateDefaultComponentByClass(clazz);
    if (component == NULL) {
        CAMSIM_ERROR_PRINTF("%s:%lu:%lu Component class %s doesn't exists.\n",
                            clazzYaml->location.file, clazzYaml->location.line,
                            clazzYaml->location.column, clazz);
        return NULL;
    }

    // Owned by the engine from now on, even if configuring it fails.
    this->components->push_back(component);
    if (component->Configure(Config(this->components, this->aliases,
                                    this->definitions, config, location)))
        return NULL;

    return component;
}

Linkable* Config::GetComponentByString(const char* string,
                                       yaml::YamlLocation location) {
    Definition* definition =
        this->definitions == NULL ? NULL : this->definitions->Get(string);
    if (definition == NULL) {
        CAMSIM_ERROR_PRINTF("%s:%lu:%lu Component does not exists: %s.\n",
                            location.file, location.line, location.column,
                            string);
        return NULL;
    }

    return this->GetComponentByMapping(definition->config,
                                       definition->location);
}

Config CreateFakeConfig(yaml::Parser* parser, const char* content,
                        Map<Linkable*>* aliases) {
    yaml::YamlValue yaml;
    if (parser->ParseString(content, &yaml)) {
        yaml::YamlLocation nowhere = {"<input string>", 0, 0};
        return Config(NULL, aliases, NULL, NULL, nowhere);
    }

    return Config(NULL, aliases, NULL, yaml.value.mapping, yaml.location);
}

#ifndef NDEBUG

int TestConfig() {
    yaml::Parser parser;
    Config config = CreateFakeConfig(&parser,
                                     "ways: 8\n"
                                     "base: 0x100\n"
                                     "ratio: 0.5\n"
                                     "enabled: yes\n"
                                     "policy: lru\n"
                                     "bad: 12abc\n"
                                     "cache:\n"
                                     "  sets: 4\n",
                                     NULL);

    long ways = 0;
    long base = 0;
    long missing = 42;
    double ratio = 0;
    bool enabled = false;
    const char* policy = NULL;

    if (config.Integer("ways", &ways, true) || ways != 8) {
        CAMSIM_ERROR_PRINTF("TestConfig %s:%d ways is %ld\n", __FILE__,
                            __LINE__, ways);
        return 1;
    }
    if (config.Integer("base", &base) || base != 0x100) {
        CAMSIM_ERROR_PRINTF("TestConfig %s:%d base is %ld\n", __FILE__,
                            __LINE__, base);
        return 1;
    }
    if (config.Integer("missing", &missing) || missing != 42) {
        CAMSIM_ERROR_PRINTF("TestConfig %s:%d optional parameter changed\n",
                            __FILE__, __LINE__);
        return 1;
    }
    if (config.Integer("missing", &missing, true) == 0) {
        CAMSIM_ERROR_PRINTF("TestConfig %s:%d required parameter ignored\n",
                            __FILE__, __LINE__);
        return 1;
    }
    if (config.Integer("bad", &missing) == 0) {
        CAMSIM_ERROR_PRINTF("TestConfig %s:%d accepted a bad integer\n",
                            __FILE__, __LINE__);
        return 1;
    }
    if (config.Floating("ratio", &ratio) || ratio != 0.5) {
        CAMSIM_ERROR_PRINTF("TestConfig %s:%d ratio is %f\n", __FILE__,
                            __LINE__, ratio);
        return 1;
    }
    if (config.Bool("enabled", &enabled) || !enabled) {
        CAMSIM_ERROR_PRINTF("TestConfig %s:%d enabled is false\n", __FILE__,
                            __LINE__);
        return 1;
    }
    if (config.String("policy", &policy) || strcmp(policy, "lru") != 0) {
        CAMSIM_ERROR_PRINTF("TestConfig %s:%d bad policy\n", __FILE__,
                            __LINE__);
        return 1;
    }

    Config cache = config;
    long sets = 0;
    if (config.Fork("cache", &cache) || cache.Integer("sets", &sets) ||
        sets != 4) {
        CAMSIM_ERROR_PRINTF("TestConfig %s:%d bad nested sets %ld\n", __FILE__,
                            __LINE__, sets);
        return 1;
    }
    if (config.Fork("ways", &cache) == 0) {
        CAMSIM_ERROR_PRINTF("TestConfig %s:%d forked a scalar\n", __FILE__,
                            __LINE__);
        return 1;
    }

    Config absent = config;
    sets = 1;
    if (config.Fork("cam", &absent) || absent.Integer("sets", &sets) ||
        sets != 1) {
        CAMSIM_ERROR_PRINTF("TestConfig %s:%d absent mapping not empty\n",
                            __FILE__, __LINE__);
        return 1;
    }

    return 0;
}

#endif  // NDEBUG
