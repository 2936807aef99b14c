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
 * @file replacement_policy.cpp
 * @brief The table of replacement policies.
 */

#include "replacement_policy.hpp"

#include <cstring>
#include <utils/cache/replacement_policies/available_invalidated.hpp>
#include <utils/cache/replacement_policies/lru.hpp>
#include <utils/cache/replacement_policies/pseudo_lru.hpp>
#include <utils/cache/replacement_policies/random.hpp>
#include <utils/cache/replacement_policies/round_robin.hpp>
#include <utils/logging.hpp>

struct ReplacementPolicyEntry {
    const char* name;
    ReplacementPolicyFactory factory;
};

static const ReplacementPolicyEntry policies[] = {
    {"plru", ReplacementPolicies::PseudoLRU::New},
    {"lru", ReplacementPolicies::LRU::New},
    {"roundrobin", ReplacementPolicies::RoundRobin::New},
    {"random", ReplacementPolicies::Random::New},
    {"available", ReplacementPolicies::AvailableInvalidated::New},
};

ReplacementPolicyFactory GetReplacementPolicyFactory(const char* name) {
    for (unsigned long i = 0; i < sizeof(policies) / sizeof(*policies); ++i) {
        if (strcmp(policies[i].name, name) == 0) return policies[i].factory;
    }
    return NULL;
}

ReplacementPolicy* CreateReplacementPolicy(const char* name, int numSets,
                                           int numWays) {
    ReplacementPolicyFactory factory = GetReplacementPolicyFactory(name);
    if (factory == NULL) {
        CAMSIM_ERROR_PRINTF("No such replacement policy: %s.\n", name);
        return NULL;
    }
    return factory(numSets, numWays);
}

int CheckReplacementPolicyGeometry(const char* policy, int numSets,
                                   int numWays) {
    if (numSets < 1) {
        CAMSIM_ERROR_PRINTF("%s: needs at least one set, got %d.\n", policy,
                            numSets);
        return 1;
    }
    if (numWays < 2) {
        CAMSIM_ERROR_PRINTF("%s: ways must be at least 2, got %d.\n", policy,
                            numWays);
        return 1;
    }
    return 0;
}

#ifndef NDEBUG

int TestReplacementPolicyFactory() {
    const char* names[] = {"plru", "lru", "roundrobin", "random", "available"};
    for (int i = 0; i < 5; ++i) {
        ReplacementPolicy* policy = CreateReplacementPolicy(names[i], 2, 4);
        if (policy == NULL) {
            CAMSIM_ERROR_PRINTF("TestReplacementPolicyFactory %s:%d %s\n",
                                __FILE__, __LINE__, names[i]);
            return 1;
        }

        // Every policy but random fills an empty set without repeating a way.
        const bool mayRepeat = strcmp(names[i], "random") == 0;
        bool used[4] = {false, false, false, false};
        for (int j = 0; j < 4; ++j) {
            int way = policy->Allocate(1);
            if (way < 0 || way >= 4 || (used[way] && !mayRepeat)) {
                CAMSIM_ERROR_PRINTF(
                    "TestReplacementPolicyFactory %s:%d %s gave way %d\n",
                    __FILE__, __LINE__, names[i], way);
                delete policy;
                return 1;
            }
            used[way] = true;
            policy->Allocated(1, way);
        }
        delete policy;
    }

    if (GetReplacementPolicyFactory("mru") != NULL ||
        CreateReplacementPolicy("mru", 1, 4) != NULL) {
        CAMSIM_ERROR_PRINTF("TestReplacementPolicyFactory %s:%d found mru\n",
                            __FILE__, __LINE__);
        return 1;
    }
    for (int i = 0; i < 5; ++i) {
        if (CreateReplacementPolicy(names[i], 1, 1) != NULL ||
            CreateReplacementPolicy(names[i], 0, 4) != NULL) {
            CAMSIM_ERROR_PRINTF(
                "TestReplacementPolicyFactory %s:%d %s bad geometry accepted\n",
                __FILE__, __LINE__, names[i]);
            return 1;
        }
    }
    if (CreateReplacementPolicy("plru", 1, 6) != NULL) {
        CAMSIM_ERROR_PRINTF(
            "TestReplacementPolicyFactory %s:%d plru accepted 6 ways\n",
            __FILE__, __LINE__);
        return 1;
    }

    // Only the tree needs a power of two.
    ReplacementPolicy* lru = CreateReplacementPolicy("lru", 1, 6);
    if (lru == NULL) {
        CAMSIM_ERROR_PRINTF(
            "TestReplacementPolicyFactory %s:%d lru refused 6 ways\n",
            __FILE__, __LINE__);
        return 1;
    }
    delete lru;

    return 0;
}

#endif  // NDEBUG
