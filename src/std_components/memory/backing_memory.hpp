#ifndef CAMSIM_STD_COMPONENTS_MEMORY_BACKING_MEMORY_HPP_
#define CAMSIM_STD_COMPONENTS_MEMORY_BACKING_MEMORY_HPP_

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
 * @file backing_memory.hpp
 * @brief The memory at the end of a channel.
 * @details BackingMemory answers every request with MemoryDataFor(address)
 * `latency` cycles after taking it. At most `throughput` requests are taken
 * per cycle, 0 meaning no limit. Requests for addresses inside
 * [`nonCacheableBase`, `nonCacheableBase` + `nonCacheableSize`) are
 * answered with nonCacheable set.
 *
 * Responses leave in the order the requests were taken. When the connection
 * of the oldest response is full, the younger ones wait behind it.
 */

#include <camsim.hpp>
#include <utils/circular_buffer.hpp>

class BackingMemory : public Component<MemoryPacket> {
  private:
    struct Pending {
        MemoryPacket response;
        unsigned long readyAt; /**< Cycle it may be sent. */
        int connection;
    };

    CircularBuffer pending;
    unsigned long cycle;
    unsigned long latency;
    unsigned long throughput;
    unsigned long nonCacheableBase;
    unsigned long nonCacheableSize;
    int nextConnection;

    unsigned long statRequests;
    unsigned long statNonCacheable;
    unsigned long statBlocked; /**< Cycles a due response couldn't leave. */

    inline bool IsNonCacheable(unsigned long address) const {
        return address >= this->nonCacheableBase &&
               address - this->nonCacheableBase < this->nonCacheableSize;
    }

    void Accept();
    void Respond();

  public:
    BackingMemory();
    virtual int Configure(Config config);
    virtual void Clock();
    virtual bool IsBusy();
    virtual void PrintStatistics();
    virtual ~BackingMemory();
};

#ifndef NDEBUG
int TestBackingMemory();
#endif

#endif  // CAMSIM_STD_COMPONENTS_MEMORY_BACKING_MEMORY_HPP_
