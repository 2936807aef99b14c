#ifndef CAMSIM_UTILS_CACHE_REPLACEMENT_POLICIES_AVAILABLE_INVALIDATED_HPP_
#define CAMSIM_UTILS_CACHE_REPLACEMENT_POLICIES_AVAILABLE_INVALIDATED_HPP_

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
 * @file available_invalidated.hpp
 * @brief Picks the lowest free way, or way 0 when the set is full.
 * @details Meant for tables whose entries are only removed by invalidation,
 * like a tracker of in-flight requests: a full set is expected never to be
 * allocated into.
 */

#include <utils/cache/replacement_policy.hpp>

namespace ReplacementPolicies {

class AvailableInvalidated : public ReplacementPolicy {
  private:
    bool* used; /**< numSets blocks of numWays flags, set by hits and
                   allocations, cleared by invalidations. */

    AvailableInvalidated(int numSets, int numWays);

  public:
    static ReplacementPolicy* New(int numSets, int numWays);

    virtual void Hit(int set, int way);
    virtual void Invalidate(int set, int way);
    virtual int Allocate(int set) const;
    virtual void Reset();
    virtual bool ReusesInvalidatedWay() const { return true; }

    virtual ~AvailableInvalidated();
};

}  // namespace ReplacementPolicies

#ifndef NDEBUG
int TestAvailableInvalidated();
#endif

#endif  // CAMSIM_UTILS_CACHE_REPLACEMENT_POLICIES_AVAILABLE_INVALIDATED_HPP_
