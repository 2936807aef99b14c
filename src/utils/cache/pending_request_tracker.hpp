#ifndef CAMSIM_UTILS_CACHE_PENDING_REQUEST_TRACKER_HPP_
#define CAMSIM_UTILS_CACHE_PENDING_REQUEST_TRACKER_HPP_

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
 * @file pending_request_tracker.hpp
 * @brief CAM of the requests a channel forwarded and still waits for.
 */

#include <utils/cache/associative_cache.hpp>

/**
 * @details A fully associative cache keyed by transaction id, holding the
 * address each id asked for. Retire() reads the address and removes the id in
 * one step, so a response can only be matched once. The step protocol is the
 * cache's: lookups and Insert(), then Clock(), then PosClock().
 */
class PendingRequestTracker {
  private:
    static const int RETIRE_PORT = 0;
    static const int LOOKUP_PORT = 1;

    AssociativeCache<unsigned long>* cam;

    PendingRequestTracker(AssociativeCache<unsigned long>* cam) : cam(cam) {}

  public:
    /** @returns NULL on error, after printing it. */
    static PendingRequestTracker* New(int ways, const char* policy);

    ~PendingRequestTracker() { delete this->cam; }

    /**
     * @brief Looks the id up and, if found, removes it at the end of the step.
     * @returns True if the id was in flight.
     */
    inline bool Retire(unsigned long id, unsigned long* address) {
        return this->cam->Read(RETIRE_PORT, id, true, address);
    }

    /** @brief Plain lookup, for admission checks. */
    inline bool IsInFlight(unsigned long id) {
        return this->cam->Read(LOOKUP_PORT, id, false, NULL);
    }

    inline void Insert(unsigned long id, unsigned long address) {
        this->cam->Fill(0, id, address, true);
    }

    inline void Clock() { this->cam->Clock(); }

    /** @brief After Clock(). */
    inline bool InsertAccepted() const { return this->cam->FillAccepted(0); }

    inline void PosClock() { this->cam->PosClock(); }

    inline bool IsFull() const { return this->cam->IsFull(); }
    inline bool IsEmpty() const { return this->cam->IsEmpty(); }
    inline int GetOccupancy() const { return this->cam->GetOccupancy(); }

    /**
     * @brief True if an id retired in a step frees its way for an id
     * inserted in the same step.
     */
    inline bool ReusesInvalidatedWay() const {
        return this->cam->ReusesInvalidatedWay();
    }

    inline void PrintStatistics(const char* name) const {
        this->cam->PrintStatistics(name);
    }
};

#ifndef NDEBUG
int TestPendingRequestTracker();
#endif

#endif  // CAMSIM_UTILS_CACHE_PENDING_REQUEST_TRACKER_HPP_
