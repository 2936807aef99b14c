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
 * @file lru.cpp
 * @brief Implementation of LRU as replacement policy.
 */

#include "lru.hpp"

#include <climits>
#include <cstring>
#include <utils/logging.hpp>

namespace ReplacementPolicies {

/** @brief Age of an invalidated way. Hits never age a way this far. */
static const unsigned int EMPTY_AGE = UINT_MAX;

ReplacementPolicy* LRU::New(int numSets, int numWays) {
    if (CheckReplacementPolicyGeometry("lru", numSets, numWays)) return NULL;
    return new LRU(numSets, numWays);
}

LRU::LRU(int numSets, int numWays) : ReplacementPolicy(numSets, numWays) {
    this->wayUsageCounters = new unsigned int*[this->numSets];
    int n = this->numSets * this->numWays;
    this->wayUsageCounters[0] = new unsigned int[n];
    for (int i = 1; i < this->numSets; i++) {
        this->wayUsageCounters[i] =
            this->wayUsageCounters[0] + (i * this->numWays);
    }
    this->Reset();
};

LRU::~LRU() {
    delete[] this->wayUsageCounters[0];
    delete[] this->wayUsageCounters;
}

void LRU::Reset() {
    memset(this->wayUsageCounters[0], 0,
           this->numSets * this->numWays * sizeof(unsigned int));
}

void LRU::Hit(int set, int way) {
    unsigned int* counters = this->wayUsageCounters[set];
    for (int i = 0; i < this->numWays; ++i) {
        if (counters[i] < EMPTY_AGE - 1) counters[i] += 1;
    }
    counters[way] = 0;
}

void LRU::Invalidate(int set, int way) {
    this->wayUsageCounters[set][way] = EMPTY_AGE;
}

int LRU::Allocate(int set) const {
    const unsigned int* counters = this->wayUsageCounters[set];
    int victim = 0;
    for (int way = 1; way < this->numWays; ++way) {
        if (counters[way] > counters[victim]) victim = way;
    }
    return victim;
}

}  // namespace ReplacementPolicies

#ifndef NDEBUG

int TestLRU() {
    ReplacementPolicy* lru = ReplacementPolicies::LRU::New(1, 4);

    for (int way = 0; way < 4; ++way) {
        if (lru->Allocate(0) != way) {
            CAMSIM_ERROR_PRINTF("TestLRU %s:%d expected way %d, got %d\n",
                                __FILE__, __LINE__, way, lru->Allocate(0));
            delete lru;
            return 1;
        }
        lru->Allocated(0, way);
    }

    // Touch 0 and 1 again: 2 is now the oldest.
    lru->Hit(0, 0);
    lru->Hit(0, 1);
    if (lru->Allocate(0) != 2) {
        CAMSIM_ERROR_PRINTF("TestLRU %s:%d expected way 2, got %d\n", __FILE__,
                            __LINE__, lru->Allocate(0));
        delete lru;
        return 1;
    }

    lru->Invalidate(0, 1);
    if (lru->Allocate(0) != 1) {
        CAMSIM_ERROR_PRINTF("TestLRU %s:%d invalidated way not chosen\n",
                            __FILE__, __LINE__);
        delete lru;
        return 1;
    }

    // Refilling it makes it the youngest again.
    lru->Allocated(0, 1);
    if (lru->Allocate(0) != 2) {
        CAMSIM_ERROR_PRINTF("TestLRU %s:%d expected way 2 after refill\n",
                            __FILE__, __LINE__);
        delete lru;
        return 1;
    }

    delete lru;
    return 0;
}

#endif  // NDEBUG
