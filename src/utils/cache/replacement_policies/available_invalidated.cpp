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
 * @file available_invalidated.cpp
 * @brief Implementation of AvailableInvalidated as replacement policy.
 */

#include "available_invalidated.hpp"

#include <cstring>
#include <utils/logging.hpp>

namespace ReplacementPolicies {

ReplacementPolicy* AvailableInvalidated::New(int numSets, int numWays) {
    if (CheckReplacementPolicyGeometry("available", numSets, numWays))
        return NULL;
    return new AvailableInvalidated(numSets, numWays);
}

AvailableInvalidated::AvailableInvalidated(int numSets, int numWays)
    : ReplacementPolicy(numSets, numWays) {
    this->used = new bool[this->numSets * this->numWays];
    this->Reset();
}

AvailableInvalidated::~AvailableInvalidated() { delete[] this->used; }

void AvailableInvalidated::Reset() {
    memset(this->used, 0, sizeof(bool) * this->numSets * this->numWays);
}

void AvailableInvalidated::Hit(int set, int way) {
    this->used[set * this->numWays + way] = true;
}

void AvailableInvalidated::Invalidate(int set, int way) {
    this->used[set * this->numWays + way] = false;
}

int AvailableInvalidated::Allocate(int set) const {
    const bool* ways = &this->used[set * this->numWays];
    for (int way = 0; way < this->numWays; ++way) {
        if (!ways[way]) return way;
    }
    return 0;
}

}  // namespace ReplacementPolicies

#ifndef NDEBUG

int TestAvailableInvalidated() {
    ReplacementPolicy* policy =
        ReplacementPolicies::AvailableInvalidated::New(2, 4);

    for (int way = 0; way < 4; ++way) {
        if (policy->Allocate(1) != way) {
            CAMSIM_ERROR_PRINTF(
                "TestAvailableInvalidated %s:%d expected %d, got %d\n",
                __FILE__, __LINE__, way, policy->Allocate(1));
            delete policy;
            return 1;
        }
        policy->Allocated(1, way);
    }
    if (policy->Allocate(1) != 0 || policy->Allocate(0) != 0) {
        CAMSIM_ERROR_PRINTF("TestAvailableInvalidated %s:%d full set\n",
                            __FILE__, __LINE__);
        delete policy;
        return 1;
    }

    policy->Invalidate(1, 2);
    policy->Hit(1, 3);
    if (policy->Allocate(1) != 2) {
        CAMSIM_ERROR_PRINTF(
            "TestAvailableInvalidated %s:%d freed way not reused\n", __FILE__,
            __LINE__);
        delete policy;
        return 1;
    }

    // A line written back into the freed way makes it used again.
    policy->Hit(1, 2);
    if (policy->Allocate(1) != 0) {
        CAMSIM_ERROR_PRINTF("TestAvailableInvalidated %s:%d hit ignored\n",
                            __FILE__, __LINE__);
        delete policy;
        return 1;
    }
    policy->Invalidate(1, 2);
    if (policy->Allocate(1) != 2) {
        CAMSIM_ERROR_PRINTF(
            "TestAvailableInvalidated %s:%d freed way not reused\n", __FILE__,
            __LINE__);
        delete policy;
        return 1;
    }

    policy->Reset();
    policy->Allocated(1, 0);
    if (policy->Allocate(1) != 1) {
        CAMSIM_ERROR_PRINTF("TestAvailableInvalidated %s:%d after reset\n",
                            __FILE__, __LINE__);
        delete policy;
        return 1;
    }

    delete policy;
    return 0;
}

#endif  // NDEBUG
