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
 * @file random.cpp
 * @brief Implementation of Random as replacement policy.
 */

#include "random.hpp"

#include <utils/logging.hpp>

namespace ReplacementPolicies {

ReplacementPolicy* Random::New(int numSets, int numWays) {
    if (CheckReplacementPolicyGeometry("random", numSets, numWays))
        return NULL;
    return new Random(numSets, numWays);
}

Random::Random(int numSets, int numWays)
    : ReplacementPolicy(numSets, numWays) {
    this->nextVictim = new int[this->numSets];
    this->Reset();
}

Random::~Random() { delete[] this->nextVictim; }

int Random::Draw() { return this->generator() % this->numWays; }

void Random::Reset() {
    this->generator.seed(RANDOM_SEED);
    for (int set = 0; set < this->numSets; ++set) {
        this->nextVictim[set] = this->Draw();
    }
}

void Random::Hit(int set, int way) {
    (void)set;
    (void)way;
}

void Random::Invalidate(int set, int way) {
    (void)set;
    (void)way;
}

int Random::Allocate(int set) const { return this->nextVictim[set]; }

void Random::Allocated(int set, int way) {
    (void)way;
    this->nextVictim[set] = this->Draw();
}

}  // namespace ReplacementPolicies

#ifndef NDEBUG

int TestRandomPolicy() {
    ReplacementPolicy* a = ReplacementPolicies::Random::New(2, 4);
    ReplacementPolicy* b = ReplacementPolicies::Random::New(2, 4);
    int ret = 0;

    // Same seed, same victims.
    for (int i = 0; i < 64 && ret == 0; ++i) {
        int set = i & 1;
        int way = a->Allocate(set);
        if (way < 0 || way >= 4 || way != b->Allocate(set)) {
            CAMSIM_ERROR_PRINTF("TestRandomPolicy %s:%d step %d way %d\n",
                                __FILE__, __LINE__, i, way);
            ret = 1;
        }
        // Asking twice doesn't change the answer.
        if (a->Allocate(set) != way) {
            CAMSIM_ERROR_PRINTF("TestRandomPolicy %s:%d Allocate not pure\n",
                                __FILE__, __LINE__);
            ret = 1;
        }
        a->Allocated(set, way);
        b->Allocated(set, way);
    }

    // Reset replays the sequence.
    int first[8];
    a->Reset();
    for (int i = 0; i < 8; ++i) {
        first[i] = a->Allocate(0);
        a->Allocated(0, first[i]);
    }
    a->Reset();
    for (int i = 0; i < 8 && ret == 0; ++i) {
        if (a->Allocate(0) != first[i]) {
            CAMSIM_ERROR_PRINTF("TestRandomPolicy %s:%d reset diverged at %d\n",
                                __FILE__, __LINE__, i);
            ret = 1;
        }
        a->Allocated(0, first[i]);
    }

    delete a;
    delete b;
    return ret;
}

#endif  // NDEBUG
