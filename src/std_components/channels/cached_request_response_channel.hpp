#ifndef CAMSIM_STD_COMPONENTS_CHANNELS_CACHED_REQUEST_RESPONSE_CHANNEL_HPP_
#define CAMSIM_STD_COMPONENTS_CHANNELS_CACHED_REQUEST_RESPONSE_CHANNEL_HPP_

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
 * @file cached_request_response_channel.hpp
 * @brief A request/response channel that answers repeated reads from a
 * cache and tracks the requests it forwards.
 */

#include <cstring>
#include <engine/default_packets.hpp>
#include <utils/cache/associative_cache.hpp>
#include <utils/cache/pending_request_tracker.hpp>
#include <utils/ready_valid_fifo.hpp>

/**
 * @brief Direct write into the channel cache, bypassing the request path.
 */
struct CacheWrite {
    unsigned long address;
    unsigned long data;
    bool invalidate; /**< Removes the address instead of storing data. */
};

/**
 * @brief What the channel samples in a step. A valid flag without the
 * matching ready on the outputs means the message was not taken.
 */
struct ChannelInputs {
    bool upstreamRequestValid;
    MemoryPacket upstreamRequest;
    bool downstreamRequestReady;
    bool downstreamResponseValid;
    MemoryPacket downstreamResponse;
    bool upstreamResponseReady;
    bool cacheWriteValid; /**< Always taken. */
    CacheWrite cacheWrite;
    bool resetCache;

    inline ChannelInputs() { memset(this, 0, sizeof(*this)); }
};

/**
 * @brief What the channel drives in a step.
 */
struct ChannelOutputs {
    bool upstreamRequestReady;
    bool downstreamRequestValid; /**< Only raised when the downstream side
                                    was ready, so it is a transfer. */
    MemoryPacket downstreamRequest;
    bool downstreamResponseReady;
    bool upstreamResponseValid; /**< Head of the response buffer. It is
                                   taken if upstreamResponseReady was set. */
    MemoryPacket upstreamResponse;

    inline ChannelOutputs() { memset(this, 0, sizeof(*this)); }
};

/**
 * @details Each step the channel looks the upstream request up in the cache
 * and the downstream response up in the tracker of pending requests, then
 * settles what moves:
 *   - a cache hit is answered from the cache through the response buffer;
 *   - a miss is forwarded downstream and its id and address go into the
 *     tracker;
 *   - a downstream response retires its tracker entry, fills the cache with
 *     the address it asked for and goes into the response buffer.
 * The response buffer has one write per step and downstream responses have
 * it first. A miss needs the downstream side ready, room in the tracker and
 * its id not already in flight. A step's writes land at PosClock().
 *
 * The cache write interface owns the cache fill port while valid and stalls
 * both the upstream requests and the downstream responses. resetCache clears
 * only the cache: while it is high hits are ignored and nothing is filled.
 */
class CachedRequestResponseChannel {
  private:
    AssociativeCache<unsigned long>* cache;
    PendingRequestTracker* tracker;
    ReadyValidFifo<MemoryPacket>* responses;

    unsigned long statHits;
    unsigned long statMisses;
    unsigned long statRetired;
    unsigned long statDelivered;
    unsigned long statUnexpected;
    unsigned long statCacheWrites;
    unsigned long statStallResponseBuffer;
    unsigned long statStallTrackerFull;
    unsigned long statStallIdInFlight;
    unsigned long statStallDownstream;
    unsigned long statStallCacheWrite;

    CachedRequestResponseChannel();

  public:
    /**
     * @param ways Ways of the cache, per set.
     * @param sets Sets of the cache, a power of two.
     * @param camWays Requests that can be in flight at once.
     * @returns NULL on error, after printing it.
     */
    static CachedRequestResponseChannel* New(int ways, int sets,
                                             const char* policy, int camWays,
                                             const char* camPolicy,
                                             int responseBufferDepth);

    ~CachedRequestResponseChannel();

    void Clock(const ChannelInputs* inputs, ChannelOutputs* outputs);
    void PosClock();

    /** @brief True while requests are in flight or responses are buffered. */
    inline bool IsBusy() const {
        return !this->tracker->IsEmpty() || !this->responses->IsEmpty();
    }

    /**
     * @brief The response the next Clock() offers upstream, so the caller
     * can work out upstreamResponseReady for it.
     * @return 0 if successfuly, 1 if no response is buffered.
     */
    inline bool PeekResponse(MemoryPacket* response) const {
        return this->responses->Peek(response);
    }

    inline const AssociativeCache<unsigned long>* GetCache() const {
        return this->cache;
    }
    inline const PendingRequestTracker* GetTracker() const {
        return this->tracker;
    }
    inline int GetBufferedResponses() const {
        return this->responses->GetOccupancy();
    }

    inline unsigned long GetStatHits() const { return this->statHits; }
    inline unsigned long GetStatMisses() const { return this->statMisses; }
    inline unsigned long GetStatRetired() const { return this->statRetired; }
    inline unsigned long GetStatDelivered() const {
        return this->statDelivered;
    }
    inline unsigned long GetStatUnexpected() const {
        return this->statUnexpected;
    }

    void PrintStatistics(const char* name) const;
};

#ifndef NDEBUG
int TestCachedChannelMissThenResponse();
int TestCachedChannelIdInFlight();
int TestCachedChannelResponseBackpressure();
int TestCachedChannelTrackerFull();
int TestCachedChannelOutOfOrderRetire();
int TestCachedChannelCacheWrite();
int TestCachedChannelResetCache();
int TestCachedChannelNonCacheable();
int TestCachedChannelFuzz();
#endif

#endif  // CAMSIM_STD_COMPONENTS_CHANNELS_CACHED_REQUEST_RESPONSE_CHANNEL_HPP_
