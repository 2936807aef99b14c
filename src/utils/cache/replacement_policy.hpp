#ifndef CAMSIM_UTILS_CACHE_REPLACEMENT_POLICY_HPP_
#define CAMSIM_UTILS_CACHE_REPLACEMENT_POLICY_HPP_

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
 * @file replacement_policy.hpp
 * @brief Interface every replacement policy implements, and the table that
 * finds them by name.
 */

/**
 * @brief Chooses victims for an associative cache.
 * @details One object serves all the sets of a cache. The cache reports what
 * happened to each way through Hit(), Invalidate() and Allocated(), and asks
 * for a victim with Allocate(), which never changes the policy state. Within a
 * cycle the cache folds the events in the order invalidates, hits,
 * allocations, so each Allocate() sees everything reported before it.
 */
class ReplacementPolicy {
  public:
    ReplacementPolicy(int numSets, int numWays)
        : numSets(numSets), numWays(numWays) {};
    virtual ~ReplacementPolicy() {};

    /** @brief The way was used. */
    virtual void Hit(int set, int way) = 0;
    /** @brief The way was emptied. */
    virtual void Invalidate(int set, int way) = 0;
    /** @brief The way to replace next in the set. */
    virtual int Allocate(int set) const = 0;
    /** @brief The way returned by Allocate() was filled. */
    virtual void Allocated(int set, int way) { this->Hit(set, way); }
    /** @brief Back to the state right after construction. */
    virtual void Reset() = 0;

    /**
     * @brief True when Invalidate(set, w) guarantees the next Allocate(set)
     * returns w, provided no other event on the set comes in between.
     */
    virtual bool ReusesInvalidatedWay() const { return false; }

    inline int GetNumSets() const { return this->numSets; }
    inline int GetNumWays() const { return this->numWays; }

  protected:
    int numSets;
    int numWays;
};

/**
 * @brief Builds a policy, or prints why it can't and returns NULL.
 */
typedef ReplacementPolicy* (*ReplacementPolicyFactory)(int numSets,
                                                        int numWays);

/**
 * @brief Finds a factory by name: plru, lru, roundrobin, random or available.
 * @returns NULL if there's no such policy.
 */
ReplacementPolicyFactory GetReplacementPolicyFactory(const char* name);

/**
 * @brief Shorthand for GetReplacementPolicyFactory(name)(numSets, numWays).
 * @returns NULL on error, after printing it.
 */
ReplacementPolicy* CreateReplacementPolicy(const char* name, int numSets,
                                           int numWays);

/**
 * @brief Shared construction checks: at least one set and two ways.
 * @returns Non-zero on error, after printing it.
 */
int CheckReplacementPolicyGeometry(const char* policy, int numSets,
                                   int numWays);

static inline bool IsPowerOfTwo(long value) {
    return value > 0 && (value & (value - 1)) == 0;
}

#ifndef NDEBUG
int TestReplacementPolicyFactory();
#endif

#endif  // CAMSIM_UTILS_CACHE_REPLACEMENT_POLICY_HPP_
