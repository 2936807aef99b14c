#ifndef CAMSIM_UTILS_CACHE_REPLACEMENT_POLICIES_LRU_HPP_
#define CAMSIM_UTILS_CACHE_REPLACEMENT_POLICIES_LRU_HPP_

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
 * @file lru.hpp
 * @brief True LRU with one age counter per way.
 */

#include <utils/cache/replacement_policy.hpp>

namespace ReplacementPolicies {

class LRU : public ReplacementPolicy {
  private:
    unsigned int** wayUsageCounters; /**< Cycles of age, per set and way. */

    LRU(int numSets, int numWays);

  public:
    static ReplacementPolicy* New(int numSets, int numWays);

    virtual void Hit(int set, int way);
    virtual void Invalidate(int set, int way);
    virtual int Allocate(int set) const;
    virtual void Reset();
    virtual bool ReusesInvalidatedWay() const { return true; }

    virtual ~LRU();
};

}  // namespace ReplacementPolicies

#ifndef NDEBUG
int TestLRU();
#endif

#endif  // CAMSIM_UTILS_CACHE_REPLACEMENT_POLICIES_LRU_HPP_
