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
 * @file round_robin.cpp
 * @brief Implementation of RoundRobin as replacement policy.
 */

#include "round_robin.hpp"

#include <cstring>
#include <utils/logging.hpp>

namespace ReplacementPolicies {

ReplacementPolicy* RoundRobin::New(int numSets, int numWays) {
    if (CheckReplacementPolicyGeometry("roundrobin", numSets, numWays))
        return NULL;
    return new RoundRobin(numSets, numWays);
}

RoundRobin::RoundRobin(int numSets, int numWays)
    : ReplacementPolicy(numSets, numWays) {
    this->rrIndex = new int[this->numSets];
    this->Reset();
}

RoundRobin::~RoundRobin() { delete[] this->rrIndex; }

void RoundRobin::Reset() {
    memset(this->rrIndex, 0, sizeof(int) * this->numSets);
}

void RoundRobin::Hit(int set, int way) {
    (void)set;
    (void)way;
}

void RoundRobin::Invalidate(int set, int way) {
    (void)set;
    (void)way;
}

int RoundRobin::Allocate(int set) const { return this->rrIndex[set]; }

void RoundRobin::Allocated(int set, int way) {
    if (way == this->rrIndex[set]) {
        this->rrIndex[set] = (this->rrIndex[set] + 1) % this->numWays;
    }
}

}  // namespace ReplacementPolicies

#ifndef NDEBUG

int TestRoundRobin() {
    ReplacementPolicy* rr = ReplacementPolicies::RoundRobin::New(1, 4);

    // Hits and invalidations don't move the pointer.
    rr->Hit(0, 0);
    rr->Invalidate(0, 2);
    for (int i = 0; i < 9; ++i) {
        int way = rr->Allocate(0);
        if (way != i % 4) {
            CAMSIM_ERROR_PRINTF("TestRoundRobin %s:%d expected %d, got %d\n",
                                __FILE__, __LINE__, i % 4, way);
            delete rr;
            return 1;
        }
        rr->Hit(0, (way + 1) % 4);
        rr->Allocated(0, way);
    }

    rr->Reset();
    if (rr->Allocate(0) != 0) {
        CAMSIM_ERROR_PRINTF("TestRoundRobin %s:%d reset kept the pointer\n",
                            __FILE__, __LINE__);
        delete rr;
        return 1;
    }

    delete rr;
    return 0;
}

#endif  // NDEBUG
