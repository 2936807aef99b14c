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
 * @file engine_builder.cpp
 * @brief Takes a configuration and instantiates the simulation engine.
 * @details It gets the Yaml tree from yaml_parser.hpp and traverses it in two
 * passes:
 * - Every root entry is a component definition, stored by it's name. Entries
 *   with an anchor are allocated right away, and the anchor becomes an alias
 *   to them;
 * - Then every allocated component is configured. References in the
 *   parameters either resolve to an alias or create a new component, from a
 *   definition name or from an inline mapping, configured on the spot.
 * As every aliased component exists before any is configured, a component
 * may point to another one defined after it.
 */

#include "engine_builder.hpp"

#include <cstring>

int EngineBuilder::AddDefinition(const char* name, yaml::YamlValue* value) {
    if (value->type != yaml::YamlValueTypeMapping) {
        CAMSIM_ERROR_PRINTF(
            "%s:%lu:%lu Root entry %s is a %s, not a component definition.\n",
            value->location.file, value->location.line, value->location.column,
            name, value->TypeAsString());
        return 1;
    }

    Definition definition;
    definition.config = value->value.mapping;
    definition.location = value->location;
    this->definitions.Insert(name, definition);

    if (value->anchor == NULL) return 0;

    if (this->aliases.Get(value->anchor) != NULL) {
        CAMSIM_ERROR_PRINTF("%s:%lu:%lu Multiple components with alias %s.\n",
                            value->location.file, value->location.line,
                            value->location.column, value->anchor);
        return 1;
    }

    yaml::YamlValue* clazz = definition.config->Get("class");
    if (clazz == NULL || clazz->type != yaml::YamlValueTypeString) {
        CAMSIM_ERROR_PRINTF("%s:%lu:%lu Component %s has no class.\n",
                            value->location.file, value->location.line,
                            value->location.column, name);
        return 1;
    }

    Linkable* component = CreateDefaultComponentByClass(clazz->value.string);
    if (component == NULL) {
        CAMSIM_ERROR_PRINTF("%s:%lu:%lu Component class %s doesn't exists.\n",
                            clazz->location.file, clazz->location.line,
                            clazz->location.column, clazz->value.string);
        return 1;
    }

    CAMSIM_DEBUG_PRINTF("Allocated %s (%s) as *%s.\n", name,
                        clazz->value.string, value->anchor);

    this->components.push_back(component);
    this->aliases.Insert(value->anchor, component);

    InstanceWithDefinition instance;
    instance.component = component;
    instance.definition = definition;
    this->instances.push_back(instance);

    return 0;
}

int EngineBuilder::ConfigureInstances() {
    for (unsigned long i = 0; i < this->instances.size(); ++i) {
        const Definition* definition = &this->instances[i].definition;
        Config config(&this->components, &this->aliases, &this->definitions,
                      definition->config, definition->location);
        if (this->instances[i].component->Configure(config)) return 1;
    }

    return 0;
}

Engine* EngineBuilder::Build(yaml::YamlValue* root) {
    Map<yaml::YamlValue>* mapping = root->value.mapping;
    yaml::YamlValue value;

    mapping->ResetIterator();
    for (const char* key = mapping->Next(&value); key != NULL;
         key = mapping->Next(&value)) {
        if (strcmp(key, "include") == 0) continue;
        if (this->AddDefinition(key, mapping->Get(key))) {
            mapping->ResetIterator();
            return NULL;
        }
    }

    if (this->instances.empty()) {
        CAMSIM_ERROR_PRINTF(
            "%s: No anchored component, so there's nothing to simulate.\n",
            root->location.file);
        return NULL;
    }

    if (this->ConfigureInstances()) return NULL;

    Engine* engine = new Engine();
    engine->Instantiate(this->components);
    this->components.clear();

    return engine;
}

Engine* EngineBuilder::Instantiate(const char* configFile) {
    yaml::YamlValue root;
    if (this->parser.ParseFileWithIncludes(configFile, &root)) return NULL;
    return this->Build(&root);
}

Engine* EngineBuilder::InstantiateFromString(const char* content) {
    yaml::YamlValue root;
    if (this->parser.ParseString(content, &root)) return NULL;
    return this->Build(&root);
}

EngineBuilder::~EngineBuilder() {
    for (unsigned long i = 0; i < this->components.size(); ++i) {
        delete this->components[i];
    }
}

#ifndef NDEBUG

#include <std_components/misc/traffic_generator.hpp>

int TestEngineBuilder() {
    // The generator points to the channel before it's defined, the channel
    // instantiates the memory by name and the second generator brings an
    // inline memory of it's own.
    EngineBuilder builder;
    Engine* engine = builder.InstantiateFromString(
        "generator: &generator\n"
        "  class: TrafficGenerator\n"
        "  sendTo: *channel\n"
        "  requests: 10\n"
        "channel: &channel\n"
        "  class: CachedChannel\n"
        "  sendTo: memory\n"
        "memory:\n"
        "  class: BackingMemory\n"
        "  latency: 2\n"
        "lonely: &lonely\n"
        "  class: TrafficGenerator\n"
        "  requests: 1\n"
        "  sendTo:\n"
        "    class: BackingMemory\n");
    if (engine == NULL) {
        CAMSIM_ERROR_PRINTF("TestEngineBuilder %s:%d build failed\n", __FILE__,
                            __LINE__);
        return 1;
    }
    if (engine->GetNumberOfComponents() != 5) {
        CAMSIM_ERROR_PRINTF("TestEngineBuilder %s:%d built %ld components\n",
                            __FILE__, __LINE__,
                            engine->GetNumberOfComponents());
        delete engine;
        return 1;
    }
    delete engine;

    const char* broken[] = {
        // Unknown class.
        "a: &a\n"
        "  class: Nothing\n",
        // Required parameter missing.
        "a: &a\n"
        "  class: CachedChannel\n",
        // Alias to nowhere.
        "a: &a\n"
        "  class: CachedChannel\n"
        "  sendTo: *b\n",
        // Root entry that isn't a definition.
        "a: 3\n",
        // Bad channel geometry.
        "m: &m\n"
        "  class: BackingMemory\n"
        "a: &a\n"
        "  class: CachedChannel\n"
        "  sendTo: *m\n"
        "  sets: 3\n",
    };
    for (unsigned long i = 0; i < sizeof(broken) / sizeof(*broken); ++i) {
        EngineBuilder brokenBuilder;
        Engine* brokenEngine = brokenBuilder.InstantiateFromString(broken[i]);
        if (brokenEngine != NULL) {
            CAMSIM_ERROR_PRINTF(
                "TestEngineBuilder %s:%d broken configuration %lu built\n",
                __FILE__, __LINE__, i);
            delete brokenEngine;
            return 1;
        }
    }

    return 0;
}

/** @brief Runs a configuration and checks every generator in it. */
static int SimulateAndCheck(const char* content, unsigned long requests) {
    EngineBuilder builder;
    Engine* engine = builder.InstantiateFromString(content);
    if (engine == NULL) {
        CAMSIM_ERROR_PRINTF("TestSimulation %s:%d build failed\n", __FILE__,
                            __LINE__);
        return 1;
    }

    int ret = 0;
    if (engine->Simulate(200000)) {
        CAMSIM_ERROR_PRINTF("TestSimulation %s:%d simulation didn't finish\n",
                            __FILE__, __LINE__);
        ret = 1;
    }

    int generators = 0;
    for (long i = 0; i < engine->GetNumberOfComponents(); ++i) {
        TrafficGenerator* generator =
            dynamic_cast<TrafficGenerator*>(engine->GetComponent(i));
        if (generator == NULL) continue;
        ++generators;
        if (generator->GetCompleted() != requests ||
            generator->GetErrors() != 0) {
            CAMSIM_ERROR_PRINTF(
                "TestSimulation %s:%d completed %lu of %lu with %lu errors\n",
                __FILE__, __LINE__, generator->GetCompleted(), requests,
                generator->GetErrors());
            ret = 1;
        }
    }
    if (generators == 0) {
        CAMSIM_ERROR_PRINTF("TestSimulation %s:%d no generator\n", __FILE__,
                            __LINE__);
        ret = 1;
    }

    delete engine;
    return ret;
}

int TestSimulation() {
    // Two generators share a cached channel over a slow memory with a
    // non-cacheable window.
    if (SimulateAndCheck("first: &first\n"
                         "  class: TrafficGenerator\n"
                         "  sendTo: *channel\n"
                         "  requests: 2000\n"
                         "  ids: 8\n"
                         "  range: 64\n"
                         "  pattern: random\n"
                         "  seed: 3\n"
                         "  bufferSize: 2\n"
                         "second: &second\n"
                         "  class: TrafficGenerator\n"
                         "  sendTo: *channel\n"
                         "  requests: 2000\n"
                         "  ids: 4\n"
                         "  base: 16\n"
                         "  range: 256\n"
                         "  stride: 8\n"
                         "channel: &channel\n"
                         "  class: CachedChannel\n"
                         "  sendTo: *memory\n"
                         "  ways: 4\n"
                         "  sets: 4\n"
                         "  camWays: 4\n"
                         "  camPolicy: available\n"
                         "  responseBufferDepth: 2\n"
                         "memory: &memory\n"
                         "  class: BackingMemory\n"
                         "  latency: 7\n"
                         "  throughput: 1\n"
                         "  nonCacheableBase: 32\n"
                         "  nonCacheableSize: 16\n",
                         2000))
        return 1;

    // Ids are shared by both generators, so one of them waits on the other
    // when they collide.
    if (SimulateAndCheck("first: &first\n"
                         "  class: TrafficGenerator\n"
                         "  sendTo: *channel\n"
                         "  requests: 500\n"
                         "  ids: 2\n"
                         "  pattern: random\n"
                         "second: &second\n"
                         "  class: TrafficGenerator\n"
                         "  sendTo: *channel\n"
                         "  requests: 500\n"
                         "  ids: 2\n"
                         "channel: &channel\n"
                         "  class: BufferedChannel\n"
                         "  sendTo:\n"
                         "    class: BackingMemory\n"
                         "    latency: 3\n",
                         500))
        return 1;

    // Cached channels in a chain.
    return SimulateAndCheck("generator: &generator\n"
                            "  class: TrafficGenerator\n"
                            "  sendTo: *l1\n"
                            "  requests: 3000\n"
                            "  ids: 16\n"
                            "  range: 128\n"
                            "  pattern: random\n"
                            "  seed: 11\n"
                            "l1: &l1\n"
                            "  class: CachedChannel\n"
                            "  sendTo: *l2\n"
                            "  ways: 2\n"
                            "  policy: lru\n"
                            "  camWays: 8\n"
                            "l2: &l2\n"
                            "  class: CachedChannel\n"
                            "  sendTo: *memory\n"
                            "  ways: 8\n"
                            "  sets: 2\n"
                            "  policy: roundrobin\n"
                            "  camPolicy: random\n"
                            "memory: &memory\n"
                            "  class: BackingMemory\n"
                            "  latency: 20\n",
                            3000);
}

#endif  // NDEBUG
