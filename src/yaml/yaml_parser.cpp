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
 * @file yaml_parser.cpp
 * @brief Implementation of YAML parsing for camsim.
 * @details It's a "recursive descent"-ish parser over libyaml events.
 */

#include "yaml_parser.hpp"

#include <yaml.h>

#include <cstdio>
#include <cstring>
#include <new>
#include <utils/logging.hpp>
#include <vector>

/** @brief Deeper include chains are assumed to be cycles. */
static const int MAX_INCLUDE_DEPTH = 16;

static inline yaml::YamlLocation LocationFromMark(const yaml_mark_t mark,
                                                  const char* file) {
    yaml::YamlLocation location;
    location.column = mark.column;
    location.line = mark.line + 1;
    location.file = file;
    return location;
}

const char* yaml::Parser::CopyString(const char* string) {
    if (string == NULL) return NULL;
    const unsigned long size = strlen(string) + 1;
    char* copy = (char*)this->arena.Alloc(size);
    memcpy(copy, string, size);
    return copy;
}

int yaml::Parser::YamlParseAndLogError(yaml_event_t* event) {
    if (!yaml_parser_parse(&this->parser, event)) {
        CAMSIM_ERROR_PRINTF("while reading config file %s: %s at %lu:%lu\n",
                            this->parser.context ? this->parser.context : "",
                            this->parser.problem ? this->parser.problem : "",
                            (unsigned long)this->parser.problem_mark.line + 1,
                            (unsigned long)this->parser.problem_mark.column);
        return 1;
    }

    return 0;
}

int yaml::Parser::EnsureFileIsYamlMapping(YamlLocation* location,
                                          const char* file) {
    yaml_event_t event;

    // Assert toplevel is sane: stream start, then document, then mapping.
    const yaml_event_type_t expected[] = {YAML_STREAM_START_EVENT,
                                          YAML_DOCUMENT_START_EVENT,
                                          YAML_MAPPING_START_EVENT};
    for (int i = 0; i < 3; ++i) {
        if (this->YamlParseAndLogError(&event)) return 1;
        if (event.type != expected[i]) {
            CAMSIM_ERROR_PRINTF(
                "while reading config file %s: file is not a YAML mapping.\n",
                file);
            yaml_event_delete(&event);
            return 1;
        }
        if (i == 2) *location = LocationFromMark(event.start_mark, file);
        yaml_event_delete(&event);
    }

    return 0;
}

int yaml::Parser::ParseMapping(const YamlLocation location, const char* anchor,
                               YamlValue* ret) {
    *ret = yaml::YamlValue(yaml::YamlValueTypeMapping, location,
                           this->CopyString(anchor));
    void* mem = this->arena.Alloc(sizeof(Map<YamlValue>));
    ret->value.mapping = new (mem) Map<YamlValue>(&this->arena);

    yaml_event_t event;
    yaml_event_type_t eventType;
    do {
        if (this->YamlParseAndLogError(&event)) return 1;

        eventType = event.type;
        if (eventType == YAML_SCALAR_EVENT) {
            const char* key = (const char*)event.data.scalar.value;
            yaml::YamlValue value;
            if (this->ParseYamlValue(location.file, &value)) {
                yaml_event_delete(&event);
                return 1;
            }
            ret->value.mapping->Insert(key, value);
        } else if (eventType != YAML_MAPPING_END_EVENT) {
            CAMSIM_ERROR_PRINTF(
                "%s:%lu:%lu Mapping keys must be plain strings.\n",
                location.file, (unsigned long)event.start_mark.line + 1,
                (unsigned long)event.start_mark.column);
            yaml_event_delete(&event);
            return 1;
        }
        yaml_event_delete(&event);
    } while (eventType != YAML_MAPPING_END_EVENT);

    return 0;
}

int yaml::Parser::ParseSequence(YamlLocation location, const char* anchor,
                                YamlValue* ret) {
    *ret = yaml::YamlValue(yaml::YamlValueTypeArray, location,
                           this->CopyString(anchor));

    yaml_event_t event;
    std::vector<yaml::YamlValue> array;

    // The loop breaks when event.type is YAML_SEQUENCE_END_EVENT.
    for (;;) {
        if (this->YamlParseAndLogError(&event)) return 1;

        if (event.type == YAML_SEQUENCE_END_EVENT) {
            yaml_event_delete(&event);
            break;
        }

        yaml::YamlValue value;
        int result =
            this->ParseYamlValueFromEvent(&event, location.file, &value);
        yaml_event_delete(&event);
        if (result) return 1;
        array.push_back(value);
    }

    ret->value.array.size = array.size();
    ret->value.array.elements = (YamlValue*)this->arena.Alloc(
        (array.size() + 1) * sizeof(YamlValue));
    for (unsigned long i = 0; i < array.size(); ++i) {
        ret->value.array.elements[i] = array[i];
    }

    return 0;
}

int yaml::Parser::ParseYamlValueFromEvent(yaml_event_t* event, const char* file,
                                          YamlValue* ret) {
    yaml::YamlLocation location = LocationFromMark(event->start_mark, file);
    switch (event->type) {
        case YAML_ALIAS_EVENT:
            *ret = yaml::YamlValue(yaml::YamlValueTypeAlias, location);
            ret->value.alias =
                this->CopyString((const char*)event->data.alias.anchor);
            return 0;
        case YAML_SCALAR_EVENT:
            *ret = yaml::YamlValue(
                yaml::YamlValueTypeString, location,
                this->CopyString((const char*)event->data.scalar.anchor));
            ret->value.string =
                this->CopyString((const char*)event->data.scalar.value);
            return 0;
        case YAML_MAPPING_START_EVENT:
            return this->ParseMapping(
                location, (const char*)event->data.mapping_start.anchor, ret);
        case YAML_SEQUENCE_START_EVENT:
            return this->ParseSequence(
                location, (const char*)event->data.sequence_start.anchor, ret);
        default:
            CAMSIM_ERROR_PRINTF("%s:%lu:%lu Unexpected YAML event %d.\n",
                                location.file, location.line, location.column,
                                event->type);
            return 1;
    }
}

int yaml::Parser::ParseYamlValue(const char* file, YamlValue* ret) {
    yaml_event_t event;
    if (this->YamlParseAndLogError(&event)) return 1;

    int result = this->ParseYamlValueFromEvent(&event, file, ret);
    yaml_event_delete(&event);

    return result;
}

int yaml::Parser::ParseFile(const char* configFile, YamlValue* const ret) {
    FILE* fp = fopen(configFile, "r");
    if (fp == NULL) {
        CAMSIM_ERROR_PRINTF("No such config file: %s.\n", configFile);
        return 1;
    }

    if (!yaml_parser_initialize(&this->parser)) {
        CAMSIM_ERROR_PRINTF("Failed to initialize the YAML parser.\n");
        fclose(fp);
        return 1;
    }
    yaml_parser_set_input_file(&this->parser, fp);

    // Locations point at the file name, so it must outlive the caller's
    // string.
    const char* file = this->CopyString(configFile);

    // We need to make sure the top level is a mapping because another thing
    // would make no sense.
    yaml::YamlLocation location;
    int result = 1;
    if (!this->EnsureFileIsYamlMapping(&location, file))
        result = this->ParseMapping(location, NULL, ret);

    yaml_parser_delete(&this->parser);

    fclose(fp);
    return result;
}

int yaml::Parser::ParseString(const char* const string, YamlValue* const ret) {
    if (!yaml_parser_initialize(&this->parser)) {
        CAMSIM_ERROR_PRINTF("Failed to initialize the YAML parser.\n");
        return 1;
    }
    yaml_parser_set_input_string(&this->parser, (const unsigned char*)string,
                                 strlen(string));

    yaml::YamlLocation location;
    int result = 1;
    if (!this->EnsureFileIsYamlMapping(&location, "<input string>"))
        result = this->ParseMapping(location, NULL, ret);

    yaml_parser_delete(&this->parser);
    return result;
}

int yaml::Parser::IncludeString(Map<YamlValue>* config, const char* string,
                                int depth) {
    // Same parser, so the included values live in our arena.
    yaml::YamlValue newFileValue;
    if (this->ParseFile(string, &newFileValue)) return 1;
    if (this->ProcessIncludeEntries(&newFileValue, depth + 1)) return 1;

    Map<YamlValue>* newValues = newFileValue.value.mapping;
    newValues->ResetIterator();
    YamlValue newValue;
    for (const char* key = newValues->Next(&newValue); key != NULL;
         key = newValues->Next(&newValue)) {
        if (strcmp(key, "include") == 0) continue;
        if (config->Get(key) == NULL) config->Insert(key, newValue);
    }

    return 0;
}

int yaml::Parser::IncludeArray(Map<YamlValue>* config, YamlArray array,
                               YamlLocation location, int depth) {
    for (unsigned int i = 0; i < array.size; ++i) {
        const yaml::YamlValue* const value = &array.elements[i];
        if (value->type != yaml::YamlValueTypeString) {
            CAMSIM_ERROR_PRINTF(
                "%s:%lu:%lu: include array members "
                "should all be string. Got %s at %s:%lu:%lu.\n",
                location.file, location.line, location.column,
                value->TypeAsString(), value->location.file,
                value->location.line, value->location.column);
            return 1;
        }

        if (this->IncludeString(config, value->value.string, depth)) return 1;
    }

    return 0;
}

int yaml::Parser::ProcessIncludeEntries(yaml::YamlValue* config, int depth) {
    if (depth > MAX_INCLUDE_DEPTH) {
        CAMSIM_ERROR_PRINTF("%s:%lu:%lu: includes nested too deep.\n",
                            config->location.file, config->location.line,
                            config->location.column);
        return 1;
    }

    Map<YamlValue>* configMapping = config->value.mapping;
    YamlValue* entry = configMapping->Get("include");
    if (entry == NULL) return 0;

    int result = 0;
    switch (entry->type) {
        case yaml::YamlValueTypeString:
            result = this->IncludeString(configMapping, entry->value.string,
                                         depth);
            break;
        case yaml::YamlValueTypeArray:
            result = this->IncludeArray(configMapping, entry->value.array,
                                        entry->location, depth);
            break;
        default:
            CAMSIM_ERROR_PRINTF(
                "%s:%lu:%lu: include should "
                "be a string or an array of strings.\n",
                entry->location.file, entry->location.line,
                entry->location.column);
            return 1;
    }

    if (result) {
        CAMSIM_ERROR_PRINTF("%s:%lu:%lu: while including files.\n",
                            entry->location.file, entry->location.line,
                            entry->location.column);
    }

    return result;
}

int yaml::Parser::ParseFileWithIncludes(const char* configFile,
                                        YamlValue* ret) {
    if (this->ParseFile(configFile, ret)) return 1;
    if (this->ProcessIncludeEntries(ret, 0)) return 1;

    return 0;
}

#ifndef NDEBUG

int TestYamlParser() {
    yaml::Parser parser;
    yaml::YamlValue root;

    if (parser.ParseString("memory: &mem\n"
                           "  class: BackingMemory\n"
                           "  latency: 3\n"
                           "ports: [1, 2, 3]\n"
                           "user: *mem\n",
                           &root)) {
        CAMSIM_ERROR_PRINTF("TestYamlParser %s:%d parse failed\n", __FILE__,
                            __LINE__);
        return 1;
    }

    yaml::YamlValue* memory = root.value.mapping->Get("memory");
    if (memory == NULL || memory->type != yaml::YamlValueTypeMapping ||
        memory->anchor == NULL || strcmp(memory->anchor, "mem") != 0) {
        CAMSIM_ERROR_PRINTF("TestYamlParser %s:%d bad anchored mapping\n",
                            __FILE__, __LINE__);
        return 1;
    }
    yaml::YamlValue* latency = memory->value.mapping->Get("latency");
    if (latency == NULL || strcmp(latency->value.string, "3") != 0 ||
        latency->location.line != 3) {
        CAMSIM_ERROR_PRINTF("TestYamlParser %s:%d bad scalar\n", __FILE__,
                            __LINE__);
        return 1;
    }

    yaml::YamlValue* ports = root.value.mapping->Get("ports");
    if (ports == NULL || ports->type != yaml::YamlValueTypeArray ||
        ports->value.array.size != 3 ||
        strcmp(ports->value.array.elements[2].value.string, "3") != 0) {
        CAMSIM_ERROR_PRINTF("TestYamlParser %s:%d bad sequence\n", __FILE__,
                            __LINE__);
        return 1;
    }

    yaml::YamlValue* user = root.value.mapping->Get("user");
    if (user == NULL || user->type != yaml::YamlValueTypeAlias ||
        strcmp(user->value.alias, "mem") != 0) {
        CAMSIM_ERROR_PRINTF("TestYamlParser %s:%d bad alias\n", __FILE__,
                            __LINE__);
        return 1;
    }

    yaml::Parser badParser;
    if (badParser.ParseString("- 1\n- 2\n", &root) == 0) {
        CAMSIM_ERROR_PRINTF("TestYamlParser %s:%d accepted a sequence root\n",
                            __FILE__, __LINE__);
        return 1;
    }

    return 0;
}

#endif  // NDEBUG
