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
 * @file pseudo_lru.cpp
 * @brief Implementation of the tree pseudo-LRU.
 */

#include "pseudo_lru.hpp"

#include <cstring>
#include <utils/logging.hpp>

namespace ReplacementPolicies {

ReplacementPolicy* PseudoLRU::New(int numSets, int numWays) {
    if (CheckReplacementPolicyGeometry("plru", numSets, numWays)) return NULL;
    if (!IsPowerOfTwo(numWays)) {
        CAMSIM_ERROR_PRINTF("plru: ways must be a power of two, got %d.\n",
                            numWays);
        return NULL;
    }
    return new PseudoLRU(numSets, numWays);
}

PseudoLRU::PseudoLRU(int numSets, int numWays)
    : ReplacementPolicy(numSets, numWays) {
    this->tree = new unsigned char[numSets * (numWays - 1)];
    this->Reset();
}

PseudoLRU::~PseudoLRU() { delete[] this->tree; }

void PseudoLRU::Reset() {
    memset(this->tree, 0, this->numSets * (this->numWays - 1));
}

void PseudoLRU::Point(int set, int way, bool towards) {
    unsigned char* bits = &this->tree[set * (this->numWays - 1)];
    int node = 0;
    int low = 0;
    int high = this->numWays;

    while (high - low > 1) {
        const int mid = low + (high - low) / 2;
        const bool left = way < mid;
        bits[node] = (left == towards);
        if (left) {
            node = 2 * node + 1;
            high = mid;
        } else {
            node = 2 * node + 2;
            low = mid;
        }
    }
}

void PseudoLRU::Hit(int set, int way) { this->Point(set, way, false); }

void PseudoLRU::Invalidate(int set, int way) { this->Point(set, way, true); }

int PseudoLRU::Allocate(int set) const {
    const unsigned char* bits = &this->tree[set * (this->numWays - 1)];
    int node = 0;
    int low = 0;
    int high = this->numWays;

    while (high - low > 1) {
        const int mid = low + (high - low) / 2;
        if (bits[node]) {
            node = 2 * node + 1;
            high = mid;
        } else {
            node = 2 * node + 2;
            low = mid;
        }
    }

    return low;
}

}  // namespace ReplacementPolicies

#ifndef NDEBUG

int TestPseudoLRU() {
    ReplacementPolicy* policy = ReplacementPolicies::PseudoLRU::New(1, 4);
    ReplacementPolicies::PseudoLRU* plru =
        static_cast<ReplacementPolicies::PseudoLRU*>(policy);

    // Filling an empty set visits each way once: 3, 1, 2, 0.
    const int expected[] = {3, 1, 2, 0};
    for (int i = 0; i < 4; ++i) {
        int way = plru->Allocate(0);
        if (way != expected[i]) {
            CAMSIM_ERROR_PRINTF("TestPseudoLRU %s:%d allocation %d got way %d\n",
                                __FILE__, __LINE__, i, way);
            delete plru;
            return 1;
        }
        plru->Allocated(0, way);
    }

    // Allocate doesn't mutate.
    if (plru->Allocate(0) != 3 || plru->Allocate(0) != 3) {
        CAMSIM_ERROR_PRINTF("TestPseudoLRU %s:%d allocate is not pure\n",
                            __FILE__, __LINE__);
        delete plru;
        return 1;
    }

    // A hit points every node on the path away from the way.
    plru->Hit(0, 3);
    if (!plru->Bit(0, 0) || !plru->Bit(0, 2) || plru->Allocate(0) == 3) {
        CAMSIM_ERROR_PRINTF("TestPseudoLRU %s:%d hit didn't protect way 3\n",
                            __FILE__, __LINE__);
        delete plru;
        return 1;
    }

    // An invalidate points it towards the way, whatever came before.
    for (int way = 0; way < 4; ++way) {
        plru->Invalidate(0, way);
        if (plru->Allocate(0) != way) {
            CAMSIM_ERROR_PRINTF(
                "TestPseudoLRU %s:%d invalidated way %d not reused\n",
                __FILE__, __LINE__, way);
            delete plru;
            return 1;
        }
    }

    // A hit right before a miss never gives back the hit way.
    for (int way = 0; way < 4; ++way) {
        plru->Hit(0, way);
        if (plru->Allocate(0) == way) {
            CAMSIM_ERROR_PRINTF("TestPseudoLRU %s:%d way %d hit then evicted\n",
                                __FILE__, __LINE__, way);
            delete plru;
            return 1;
        }
    }

    delete plru;

    // Sets don't share bits.
    ReplacementPolicy* sets = ReplacementPolicies::PseudoLRU::New(2, 8);
    sets->Hit(0, 7);
    if (sets->Allocate(1) != 7 || sets->Allocate(0) == 7) {
        CAMSIM_ERROR_PRINTF("TestPseudoLRU %s:%d sets interfere\n", __FILE__,
                            __LINE__);
        delete sets;
        return 1;
    }
    sets->Reset();
    if (sets->Allocate(0) != 7) {
        CAMSIM_ERROR_PRINTF("TestPseudoLRU %s:%d reset didn't clear\n",
                            __FILE__, __LINE__);
        delete sets;
        return 1;
    }
    delete sets;

    return 0;
}

#endif  // NDEBUG
