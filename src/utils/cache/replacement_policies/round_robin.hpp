#ifndef CAMSIM_UTILS_CACHE_REPLACEMENT_POLICIES_ROUND_ROBIN_HPP_
#define CAMSIM_UTILS_CACHE_REPLACEMENT_POLICIES_ROUND_ROBIN_HPP_

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
 * @file round_robin.hpp
 * @brief FIFO replacement: ways are replaced in order, hits don't matter.
 */

#include <utils/cache/replacement_policy.hpp>

namespace ReplacementPolicies {

class RoundRobin : public ReplacementPolicy {
  private:
    int* rrIndex; /**< Next victim of each set. */

    RoundRobin(int numSets, int numWays);

  public:
    static ReplacementPolicy* New(int numSets, int numWays);

    virtual void Hit(int set, int way);
    virtual void Invalidate(int set, int way);
    virtual int Allocate(int set) const;
    virtual void Allocated(int set, int way);
    virtual void Reset();

    virtual ~RoundRobin();
};

}  // namespace ReplacementPolicies

#ifndef NDEBUG
int TestRoundRobin();
#endif

#endif  // CAMSIM_UTILS_CACHE_REPLACEMENT_POLICIES_ROUND_ROBIN_HPP_
