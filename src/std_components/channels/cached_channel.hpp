#ifndef CAMSIM_STD_COMPONENTS_CHANNELS_CACHED_CHANNEL_HPP_
#define CAMSIM_STD_COMPONENTS_CHANNELS_CACHED_CHANNEL_HPP_

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
 * @file cached_channel.hpp
 * @brief Component hosting a CachedRequestResponseChannel.
 * @details Upstream components connect to the CachedChannel and send it
 * MemoryPacket requests. The channel connects to `sendTo`, forwards the
 * misses there and answers each request on the connection that issued its
 * id. Requests are taken one per cycle, visiting the connections in a
 * round-robin fashion.
 *
 * Parameters: `sendTo` (required), `ways` (4), `sets` (1), `policy`
 * (plru), `camWays` (8), `camPolicy` (plru), `responseBufferDepth` (16)
 * and `downstreamBufferSize` (1), the size of the connection to `sendTo`.
 */

#include <camsim.hpp>
#include <std_components/channels/cached_request_response_channel.hpp>
#include <std_components/channels/response_router.hpp>

class CachedChannel : public Component<MemoryPacket> {
  private:
    CachedRequestResponseChannel* channel;
    Component<MemoryPacket>* sendTo;
    int sendToId;
    int nextConnection; /**< Where the round-robin search starts. */
    ResponseRouter router;

    bool writePending;
    CacheWrite write;
    bool resetPending;

    /** @returns The connection whose request is offered, or -1. */
    int PickUpstream(MemoryPacket* request);

  public:
    CachedChannel();

    /**
     * @brief Drives the cache write interface in the next cycle.
     */
    void WriteCache(unsigned long address, unsigned long data,
                    bool invalidate);
    /**
     * @brief Raises resetCache in the next cycle.
     */
    void ResetCache();

    inline const CachedRequestResponseChannel* GetChannel() const {
        return this->channel;
    }

    virtual int Configure(Config config);
    virtual void Clock();
    virtual void PosClock();
    virtual bool IsBusy();
    virtual void PrintStatistics();
    virtual ~CachedChannel();
};

#ifndef NDEBUG
int TestCachedChannelComponent();
int TestCachedChannelConfigErrors();
#endif

#endif  // CAMSIM_STD_COMPONENTS_CHANNELS_CACHED_CHANNEL_HPP_
