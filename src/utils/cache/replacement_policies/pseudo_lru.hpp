#ifndef CAMSIM_UTILS_CACHE_REPLACEMENT_POLICIES_PSEUDO_LRU_HPP_
#define CAMSIM_UTILS_CACHE_REPLACEMENT_POLICIES_PSEUDO_LRU_HPP_

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
 * @file pseudo_lru.hpp
 * @brief Tree pseudo-LRU replacement.
 * @details Each set has numWays - 1 bits forming a complete binary tree
 * stored as an array: node n has children 2n + 1 and 2n + 2, and the leaves
 * are the ways, left to right. A bit set to 1 says the left subtree holds the
 * least recently used half, 0 says the right one does. All bits start at 0,
 * so an empty set is filled from the last way backwards.
 */

#include <utils/cache/replacement_policy.hpp>

namespace ReplacementPolicies {

class PseudoLRU : public ReplacementPolicy {
  private:
    unsigned char* tree; /**< numSets blocks of numWays - 1 bits. */

    PseudoLRU(int numSets, int numWays);

    /**
     * @brief Walks root to leaf, pointing every node on the way either
     * towards the leaf or away from it.
     */
    void Point(int set, int way, bool towards);

  public:
    /** @brief NULL unless numWays is a power of two and at least 2. */
    static ReplacementPolicy* New(int numSets, int numWays);

    virtual void Hit(int set, int way);
    virtual void Invalidate(int set, int way);
    virtual int Allocate(int set) const;
    virtual void Reset();
    virtual bool ReusesInvalidatedWay() const { return true; }

    /** @brief A node bit, for inspection. */
    inline bool Bit(int set, int node) const {
        return this->tree[set * (this->numWays - 1) + node];
    }

    virtual ~PseudoLRU();
};

}  // namespace ReplacementPolicies

#ifndef NDEBUG
int TestPseudoLRU();
#endif

#endif  // CAMSIM_UTILS_CACHE_REPLACEMENT_POLICIES_PSEUDO_LRU_HPP_
