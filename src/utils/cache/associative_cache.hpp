#ifndef CAMSIM_UTILS_CACHE_ASSOCIATIVE_CACHE_HPP_
#define CAMSIM_UTILS_CACHE_ASSOCIATIVE_CACHE_HPP_

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
 * @file associative_cache.hpp
 * @brief Templated multi-port associative cache, clocked in lock-step.
 */

#include <cstring>
#include <utils/cache/replacement_policy.hpp>
#include <utils/logging.hpp>
#include <vector>

struct CacheLine {
    unsigned long tag;
    bool isValid;
};

/**
 * @brief A numSets x numWays associative cache with read, fill and eviction
 * ports.
 *
 * @details
 * The set of an address is its low bits (numSets is a power of two, and 1
 * makes the cache fully associative). The whole address is the tag, and a
 * tag is valid in at most one way.
 *
 * Each step goes like this:
 *   - Read() and Fill() are called for the ports active in the step. Read()
 *     answers at once from the state committed at the end of the previous
 *     step.
 *   - Clock() resolves the fills: hit detection, victims, evictions and the
 *     policy events, folded as invalidates, then hits, then allocations.
 *     FillAccepted() and Evicted() are valid after it.
 *   - PosClock() commits. Read invalidations are applied before fills, so a
 *     way that is retired and filled in the same step ends up holding the
 *     fill.
 *
 * A miss never pushes out a live line while its set has an empty way. When
 * the policy points at a live line, the lowest empty way is taken instead.
 *
 * Fills are resolved in port order. A fill that needs a way another fill of
 * the step already took, or that repeats the address of an earlier fill of
 * the step, is refused and must be retried.
 *
 * @code
 * AssociativeCache<unsigned long>* cache =
 *     AssociativeCache<unsigned long>::New(1, 4, 1, 1, 0, factory);
 * cache->Fill(0, 0x10, 7, true);
 * cache->Clock();
 * cache->PosClock();
 * unsigned long data;
 * if (cache->Read(0, 0x10, false, &data)) {
 *     // hit, data == 7
 * }
 * @endcode
 */
template <typename ValueType>
class AssociativeCache {
  private:
    struct ReadPort {
        bool enabled;
        bool invalidateOnHit;
        bool hit;
        int set;
        int way;
    };

    struct FillPort {
        bool enabled;
        unsigned long address;
        ValueType data;
        bool commit;

        bool hit;
        bool accepted;
        int set;
        int way;
        bool evicted;
        unsigned long evictedAddress;
        ValueType evictedData;
    };

    int numSets;
    int numWays;
    int numReadPorts;
    int numFillPorts;
    int numEvictionPorts;

    CacheLine* lines;      /**< numSets blocks of numWays lines. */
    ValueType* data;       /**< Same layout as lines. */
    ReadPort* readPorts;   /**< What each read port did this step. */
    FillPort* fillPorts;   /**< What each fill port asked for this step. */
    std::vector<int> claimed; /**< Lines taken by fills this step. */
    ReplacementPolicy* policy;

    int occupancy;
    bool resetScheduled;

    unsigned long statLookups;
    unsigned long statHits;
    unsigned long statMisses;
    unsigned long statFills;
    unsigned long statEvictions;
    unsigned long statInvalidations;

    AssociativeCache();

    inline int SetOf(unsigned long address) const {
        return static_cast<int>(address & (this->numSets - 1));
    }

    /** @returns The way holding the address, or -1. */
    int Find(int set, unsigned long address) const;

    bool IsClaimed(int set, int way) const;

    /** @brief True if a read port retires the line this step. */
    bool IsReadInvalidated(int set, int way) const;

    /** @brief True if an earlier port already allocates the address. */
    bool IsRepeatedFill(int port) const;

    /**
     * @returns The lowest way of the set that holds nothing live at commit
     * and no fill took this step, or -1.
     */
    int FreeWay(int set) const;

    void ClearPorts();

  public:
    /**
     * @brief Builds a cache, or prints why it can't.
     * @param numSets Power of two, 1 for a fully associative cache.
     * @param numWays At least 2. The policy may ask for more.
     * @param numEvictionPorts 0, or one per fill port.
     * @returns NULL on error.
     */
    static AssociativeCache* New(int numSets, int numWays, int numReadPorts,
                                 int numFillPorts, int numEvictionPorts,
                                 ReplacementPolicyFactory factory);

    ~AssociativeCache();

    /**
     * @brief Looks an address up.
     * @param invalidateOnHit On a hit, the line is gone after this step. The
     * data is still returned.
     * @param data Written only on a hit. Can be NULL.
     * @returns True on a hit.
     */
    bool Read(int port, unsigned long address, bool invalidateOnHit,
              ValueType* data);

    /**
     * @brief Stores (commit) or invalidates (!commit) an address at the end
     * of the step.
     */
    void Fill(int port, unsigned long address, const ValueType& data,
              bool commit);

    /** @brief Invalidates everything and resets the policy at commit. */
    void ScheduleReset();

    void Clock();

    /** @brief After Clock(): false if the fill has to be retried. */
    bool FillAccepted(int port) const;

    /**
     * @brief After Clock(): the line the fill of the same port pushes out.
     * @returns False if the port evicts nothing this step.
     */
    bool Evicted(int port, unsigned long* address, ValueType* data) const;

    void PosClock();

    inline int GetOccupancy() const { return this->occupancy; }
    inline bool IsFull() const {
        return this->occupancy == this->numSets * this->numWays;
    }
    inline bool IsEmpty() const { return this->occupancy == 0; }
    inline int GetNumSets() const { return this->numSets; }
    inline int GetNumWays() const { return this->numWays; }
    inline bool ReusesInvalidatedWay() const {
        return this->policy->ReusesInvalidatedWay();
    }

    /**
     * @brief Inspects a line directly, bypassing the ports.
     * @returns False if the line is invalid.
     */
    inline bool GetLine(int set, int way, unsigned long* address,
                        ValueType* data) const {
        int index = set * this->numWays + way;
        if (!this->lines[index].isValid) return false;
        *address = this->lines[index].tag;
        if (data != NULL) *data = this->data[index];
        return true;
    }

    inline unsigned long GetStatLookups() const { return this->statLookups; }
    inline unsigned long GetStatHits() const { return this->statHits; }
    inline unsigned long GetStatMisses() const { return this->statMisses; }
    inline unsigned long GetStatFills() const { return this->statFills; }
    inline unsigned long GetStatEvictions() const {
        return this->statEvictions;
    }
    inline unsigned long GetStatInvalidations() const {
        return this->statInvalidations;
    }

    void PrintStatistics(const char* name) const;
};

template <typename ValueType>
AssociativeCache<ValueType>::AssociativeCache()
    : numSets(0),
      numWays(0),
      numReadPorts(0),
      numFillPorts(0),
      numEvictionPorts(0),
      lines(NULL),
      data(NULL),
      readPorts(NULL),
      fillPorts(NULL),
      policy(NULL),
      occupancy(0),
      resetScheduled(false),
      statLookups(0),
      statHits(0),
      statMisses(0),
      statFills(0),
      statEvictions(0),
      statInvalidations(0) {}

template <typename ValueType>
AssociativeCache<ValueType>* AssociativeCache<ValueType>::New(
    int numSets, int numWays, int numReadPorts, int numFillPorts,
    int numEvictionPorts, ReplacementPolicyFactory factory) {
    if (numWays < 2) {
        CAMSIM_ERROR_PRINTF(
            "AssociativeCache: ways must be at least 2, got %d.\n", numWays);
        return NULL;
    }
    if (!IsPowerOfTwo(numSets)) {
        CAMSIM_ERROR_PRINTF(
            "AssociativeCache: sets cannot be %d because it is not a power of "
            "two.\n",
            numSets);
        return NULL;
    }
    if (numReadPorts < 1 || numFillPorts < 1) {
        CAMSIM_ERROR_PRINTF(
            "AssociativeCache: needs at least one read and one fill port, got "
            "%d and %d.\n",
            numReadPorts, numFillPorts);
        return NULL;
    }
    if (numEvictionPorts != 0 && numEvictionPorts != numFillPorts) {
        CAMSIM_ERROR_PRINTF(
            "AssociativeCache: %d eviction ports for %d fill ports.\n",
            numEvictionPorts, numFillPorts);
        return NULL;
    }
    if (factory == NULL) {
        CAMSIM_ERROR_PRINTF("AssociativeCache: no replacement policy.\n");
        return NULL;
    }

    ReplacementPolicy* policy = factory(numSets, numWays);
    if (policy == NULL) return NULL;

    AssociativeCache<ValueType>* cache = new AssociativeCache<ValueType>();
    cache->numSets = numSets;
    cache->numWays = numWays;
    cache->numReadPorts = numReadPorts;
    cache->numFillPorts = numFillPorts;
    cache->numEvictionPorts = numEvictionPorts;
    cache->policy = policy;

    int n = numSets * numWays;
    cache->lines = new CacheLine[n];
    memset(cache->lines, 0, n * sizeof(CacheLine));
    cache->data = new ValueType[n]();
    cache->readPorts = new ReadPort[numReadPorts];
    cache->fillPorts = new FillPort[numFillPorts];
    cache->claimed.reserve(numFillPorts);
    cache->ClearPorts();

    return cache;
}

template <typename ValueType>
AssociativeCache<ValueType>::~AssociativeCache() {
    delete[] this->lines;
    delete[] this->data;
    delete[] this->readPorts;
    delete[] this->fillPorts;
    delete this->policy;
}

template <typename ValueType>
int AssociativeCache<ValueType>::Find(int set, unsigned long address) const {
    const CacheLine* line = &this->lines[set * this->numWays];
    for (int way = 0; way < this->numWays; ++way) {
        if (line[way].isValid && line[way].tag == address) return way;
    }
    return -1;
}

template <typename ValueType>
bool AssociativeCache<ValueType>::IsClaimed(int set, int way) const {
    int index = set * this->numWays + way;
    for (unsigned long i = 0; i < this->claimed.size(); ++i) {
        if (this->claimed[i] == index) return true;
    }
    return false;
}

template <typename ValueType>
bool AssociativeCache<ValueType>::IsReadInvalidated(int set, int way) const {
    for (int port = 0; port < this->numReadPorts; ++port) {
        const ReadPort* read = &this->readPorts[port];
        if (read->enabled && read->hit && read->invalidateOnHit &&
            read->set == set && read->way == way)
            return true;
    }
    return false;
}

template <typename ValueType>
bool AssociativeCache<ValueType>::IsRepeatedFill(int port) const {
    for (int i = 0; i < port; ++i) {
        const FillPort* fill = &this->fillPorts[i];
        if (fill->enabled && fill->accepted && fill->commit && !fill->hit &&
            fill->address == this->fillPorts[port].address)
            return true;
    }
    return false;
}

template <typename ValueType>
int AssociativeCache<ValueType>::FreeWay(int set) const {
    const CacheLine* line = &this->lines[set * this->numWays];
    for (int way = 0; way < this->numWays; ++way) {
        if (!line[way].isValid && !this->IsClaimed(set, way)) return way;
    }
    for (int way = 0; way < this->numWays; ++way) {
        if (this->IsReadInvalidated(set, way) && !this->IsClaimed(set, way))
            return way;
    }
    return -1;
}

template <typename ValueType>
void AssociativeCache<ValueType>::ClearPorts() {
    for (int port = 0; port < this->numReadPorts; ++port) {
        this->readPorts[port].enabled = false;
        this->readPorts[port].hit = false;
    }
    for (int port = 0; port < this->numFillPorts; ++port) {
        this->fillPorts[port].enabled = false;
        this->fillPorts[port].accepted = false;
        this->fillPorts[port].evicted = false;
    }
    this->claimed.clear();
}

template <typename ValueType>
bool AssociativeCache<ValueType>::Read(int port, unsigned long address,
                                       bool invalidateOnHit,
                                       ValueType* data) {
    ReadPort* read = &this->readPorts[port];
    read->enabled = true;
    read->invalidateOnHit = invalidateOnHit;
    read->set = this->SetOf(address);
    read->way = this->Find(read->set, address);
    read->hit = read->way >= 0;

    this->statLookups += 1;
    if (!read->hit) {
        this->statMisses += 1;
        return false;
    }

    this->statHits += 1;
    if (data != NULL) *data = this->data[read->set * this->numWays + read->way];
    return true;
}

template <typename ValueType>
void AssociativeCache<ValueType>::Fill(int port, unsigned long address,
                                       const ValueType& data, bool commit) {
    FillPort* fill = &this->fillPorts[port];
    fill->enabled = true;
    fill->address = address;
    fill->data = data;
    fill->commit = commit;
}

template <typename ValueType>
void AssociativeCache<ValueType>::ScheduleReset() {
    this->resetScheduled = true;
}

template <typename ValueType>
void AssociativeCache<ValueType>::Clock() {
    if (this->resetScheduled) return;

    // Ways that already hold the address go first, in port order.
    for (int port = 0; port < this->numFillPorts; ++port) {
        FillPort* fill = &this->fillPorts[port];
        if (!fill->enabled) continue;
        fill->set = this->SetOf(fill->address);
        fill->way = this->Find(fill->set, fill->address);
        fill->hit = fill->way >= 0;
        if (!fill->hit) continue;
        if (this->IsClaimed(fill->set, fill->way)) continue;
        this->claimed.push_back(fill->set * this->numWays + fill->way);
        fill->accepted = true;
    }

    // Invalidates. A read that retires its line still counts as a use of it
    // first.
    for (int port = 0; port < this->numReadPorts; ++port) {
        const ReadPort* read = &this->readPorts[port];
        if (read->enabled && read->hit && read->invalidateOnHit) {
            this->policy->Hit(read->set, read->way);
            this->policy->Invalidate(read->set, read->way);
            this->statInvalidations += 1;
        }
    }
    for (int port = 0; port < this->numFillPorts; ++port) {
        FillPort* fill = &this->fillPorts[port];
        if (!fill->accepted || fill->commit) continue;
        this->policy->Invalidate(fill->set, fill->way);
        this->statInvalidations += 1;
        if (this->numEvictionPorts > 0) {
            int index = fill->set * this->numWays + fill->way;
            fill->evicted = true;
            fill->evictedAddress = this->lines[index].tag;
            fill->evictedData = this->data[index];
        }
    }

    // Hits.
    for (int port = 0; port < this->numReadPorts; ++port) {
        const ReadPort* read = &this->readPorts[port];
        if (read->enabled && read->hit && !read->invalidateOnHit) {
            this->policy->Hit(read->set, read->way);
        }
    }
    for (int port = 0; port < this->numFillPorts; ++port) {
        FillPort* fill = &this->fillPorts[port];
        if (!fill->accepted || !fill->commit) continue;
        this->policy->Hit(fill->set, fill->way);
        this->statFills += 1;
    }

    // Allocations.
    for (int port = 0; port < this->numFillPorts; ++port) {
        FillPort* fill = &this->fillPorts[port];
        if (!fill->enabled || fill->hit) continue;
        if (!fill->commit) {
            // Invalidating an absent address does nothing.
            fill->accepted = true;
            continue;
        }
        if (this->IsRepeatedFill(port)) continue;

        // Empty ways go before live lines. Tree pseudo-LRU may point at a
        // live way while another one is empty.
        int victim = this->policy->Allocate(fill->set);
        int index = fill->set * this->numWays + victim;
        bool live = this->lines[index].isValid &&
                    !this->IsReadInvalidated(fill->set, victim);
        if (live || this->IsClaimed(fill->set, victim)) {
            int free = this->FreeWay(fill->set);
            if (free >= 0) {
                victim = free;
                index = fill->set * this->numWays + victim;
                live = false;
            }
        }
        if (this->IsClaimed(fill->set, victim)) continue;
        this->claimed.push_back(index);
        fill->way = victim;
        fill->accepted = true;

        if (live) {
            this->statEvictions += 1;
            if (this->numEvictionPorts > 0) {
                fill->evicted = true;
                fill->evictedAddress = this->lines[index].tag;
                fill->evictedData = this->data[index];
            }
        }

        this->policy->Allocated(fill->set, victim);
        this->statFills += 1;
    }
}

template <typename ValueType>
bool AssociativeCache<ValueType>::FillAccepted(int port) const {
    return this->fillPorts[port].accepted;
}

template <typename ValueType>
bool AssociativeCache<ValueType>::Evicted(int port, unsigned long* address,
                                          ValueType* data) const {
    const FillPort* fill = &this->fillPorts[port];
    if (!fill->evicted) return false;
    *address = fill->evictedAddress;
    *data = fill->evictedData;
    return true;
}

template <typename ValueType>
void AssociativeCache<ValueType>::PosClock() {
    if (this->resetScheduled) {
        int n = this->numSets * this->numWays;
        for (int i = 0; i < n; ++i) this->lines[i].isValid = false;
        this->policy->Reset();
        this->occupancy = 0;
        this->resetScheduled = false;
        this->ClearPorts();
        return;
    }

    for (int port = 0; port < this->numReadPorts; ++port) {
        const ReadPort* read = &this->readPorts[port];
        if (!read->enabled || !read->hit || !read->invalidateOnHit) continue;
        CacheLine* line = &this->lines[read->set * this->numWays + read->way];
        // Two ports may retire the same line.
        if (line->isValid) {
            line->isValid = false;
            this->occupancy -= 1;
        }
    }

    for (int port = 0; port < this->numFillPorts; ++port) {
        const FillPort* fill = &this->fillPorts[port];
        if (!fill->accepted || (!fill->commit && !fill->hit)) continue;
        int index = fill->set * this->numWays + fill->way;
        CacheLine* line = &this->lines[index];
        if (!fill->commit) {
            if (line->isValid) {
                line->isValid = false;
                this->occupancy -= 1;
            }
            continue;
        }
        if (!line->isValid) this->occupancy += 1;
        line->isValid = true;
        line->tag = fill->address;
        this->data[index] = fill->data;
    }

    this->ClearPorts();
}

template <typename ValueType>
void AssociativeCache<ValueType>::PrintStatistics(const char* name) const {
    CAMSIM_LOG_PRINTF(
        "%s:\n\tLookups: %lu\n\tHits: %lu\n\tMisses: %lu\n\tFills: "
        "%lu\n\tEvictions: %lu\n\tInvalidations: %lu\n\tOccupancy: %d/%d\n",
        name, this->statLookups, this->statHits, this->statMisses,
        this->statFills, this->statEvictions, this->statInvalidations,
        this->occupancy, this->numSets * this->numWays);
}

#ifndef NDEBUG
int TestAssociativeCacheScenarios();
int TestAssociativeCacheReadInvalidate();
int TestAssociativeCacheEmptyWayFirst();
int TestAssociativeCachePolicyEvents();
int TestAssociativeCacheInvalidate();
int TestAssociativeCachePorts();
int TestAssociativeCacheSets();
int TestAssociativeCacheReset();
int TestAssociativeCacheErrors();
int TestAssociativeCacheFuzz();
#endif

#endif  // CAMSIM_UTILS_CACHE_ASSOCIATIVE_CACHE_HPP_
