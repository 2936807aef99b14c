#ifndef CAMSIM_STD_COMPONENTS_CHANNELS_BUFFERED_CHANNEL_HPP_
#define CAMSIM_STD_COMPONENTS_CHANNELS_BUFFERED_CHANNEL_HPP_

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
 * @file buffered_channel.hpp
 * @brief A request/response channel without a cache.
 * @details Requests go through a FIFO of `requestBufferDepth` entries on
 * their way to `sendTo` and responses through one of
 * `responseBufferDepth` entries on their way back, both 4 by default. The
 * connection scheme is the same as the CachedChannel's.
 */

#include <camsim.hpp>
#include <std_components/channels/response_router.hpp>
#include <utils/ready_valid_fifo.hpp>

class BufferedChannel : public Component<MemoryPacket> {
  private:
    ReadyValidFifo<MemoryPacket>* requests;
    ReadyValidFifo<MemoryPacket>* responses;
    Component<MemoryPacket>* sendTo;
    int sendToId;
    int nextConnection;
    ResponseRouter router;

    unsigned long statForwarded;
    unsigned long statDelivered;

    void TakeRequest();
    void ForwardRequest();
    void TakeResponse();
    void DeliverResponse();

  public:
    BufferedChannel();
    virtual int Configure(Config config);
    virtual void Clock();
    virtual void PosClock();
    virtual bool IsBusy();
    virtual void PrintStatistics();
    virtual ~BufferedChannel();
};

#ifndef NDEBUG
int TestBufferedChannel();
#endif

#endif  // CAMSIM_STD_COMPONENTS_CHANNELS_BUFFERED_CHANNEL_HPP_
