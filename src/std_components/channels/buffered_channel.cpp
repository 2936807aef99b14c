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
 * @file buffered_channel.cpp
 * @brief Implementation of the BufferedChannel.
 */

#include "buffered_channel.hpp"

BufferedChannel::BufferedChannel()
    : requests(NULL),
      responses(NULL),
      sendTo(NULL),
      sendToId(-1),
      nextConnection(0),
      statForwarded(0),
      statDelivered(0) {}

int BufferedChannel::Configure(Config config) {
    if (config.ComponentReference("sendTo", &this->sendTo, true)) return 1;

    long requestBufferDepth = 4;
    long responseBufferDepth = 4;
    long downstreamBufferSize = 1;
    if (config.Integer("requestBufferDepth", &requestBufferDepth)) return 1;
    if (config.Integer("responseBufferDepth", &responseBufferDepth)) return 1;
    if (config.Integer("downstreamBufferSize", &downstreamBufferSize))
        return 1;
    if (downstreamBufferSize < 0)
        return config.Error("downstreamBufferSize", "is not >= 0.");

    this->requests = ReadyValidFifo<MemoryPacket>::New(requestBufferDepth);
    if (this->requests == NULL)
        return config.Error("requestBufferDepth", "is not >= 1.");
    this->responses = ReadyValidFifo<MemoryPacket>::New(responseBufferDepth);
    if (this->responses == NULL)
        return config.Error("responseBufferDepth", "is not >= 1.");

    this->sendToId = this->sendTo->Connect(downstreamBufferSize);
    if (this->sendToId < 0) return 1;

    return 0;
}

void BufferedChannel::TakeRequest() {
    if (!this->requests->CanEnqueue()) return;

    const long connections = this->GetNumberOfConnections();
    MemoryPacket request;
    for (long i = 0; i < connections; ++i) {
        const int connection = (this->nextConnection + i) % connections;
        if (this->PeekRequestFromConnection(connection, &request) ||
            !this->router.CanClaim(request.id, connection))
            continue;

        this->ReceiveRequestFromConnection(connection, &request);
        this->requests->Enqueue(request);
        this->router.Claim(request.id, connection);
        this->nextConnection = connection + 1;
        return;
    }
}

void BufferedChannel::ForwardRequest() {
    MemoryPacket request;
    if (this->requests->Peek(&request)) return;
    if (!this->sendTo->CanSendRequest(this->sendToId)) return;

    if (this->sendTo->SendRequest(this->sendToId, &request)) return;
    this->requests->Dequeue(&request);
    ++this->statForwarded;
}

void BufferedChannel::TakeResponse() {
    MemoryPacket response;
    if (!this->responses->CanEnqueue()) return;
    if (this->sendTo->ReceiveResponse(this->sendToId, &response)) return;
    this->responses->Enqueue(response);
}

void BufferedChannel::DeliverResponse() {
    MemoryPacket response;
    if (this->responses->Peek(&response)) return;

    const int owner = this->router.Owner(response.id);
    if (owner < 0) {
        CAMSIM_WARNING_PRINTF(
            "BufferedChannel %p: no connection to answer id %lu, dropping "
            "the response.\n",
            (void*)this, response.id);
        this->responses->Dequeue(&response);
        return;
    }

    if (this->SendResponseToConnection(owner, &response)) return;
    this->responses->Dequeue(&response);
    this->router.Release(response.id);
    ++this->statDelivered;
}

void BufferedChannel::Clock() {
    this->TakeRequest();
    this->ForwardRequest();
    this->TakeResponse();
    this->DeliverResponse();
}

void BufferedChannel::PosClock() {
    this->requests->PosClock();
    this->responses->PosClock();
    Linkable::PosClock();
}

bool BufferedChannel::IsBusy() {
    return !this->requests->IsEmpty() || !this->responses->IsEmpty() ||
           !this->router.IsEmpty() || this->HasPendingMessages();
}

void BufferedChannel::PrintStatistics() {
    CAMSIM_LOG_PRINTF(
        "BufferedChannel %p:\n\tForwarded: %lu\n\tDelivered: %lu\n",
        (void*)this, this->statForwarded, this->statDelivered);
}

BufferedChannel::~BufferedChannel() {
    delete this->requests;
    delete this->responses;
}

#ifndef NDEBUG

#include <std_components/memory/backing_memory.hpp>

int TestBufferedChannel() {
    BackingMemory memory;
    BufferedChannel channel;

    Map<Linkable*> aliases;
    yaml::Parser memoryParser;
    yaml::Parser channelParser;
    aliases.Insert("memory", &memory);

    if (memory.Configure(
            CreateFakeConfig(&memoryParser, "latency: 1\n", &aliases)) ||
        channel.Configure(CreateFakeConfig(&channelParser,
                                           "sendTo: *memory\n"
                                           "requestBufferDepth: 2\n"
                                           "responseBufferDepth: 1\n",
                                           &aliases))) {
        CAMSIM_ERROR_PRINTF("TestBufferedChannel %s:%d configure failed\n",
                            __FILE__, __LINE__);
        return 1;
    }

    const int id = channel.Connect(0);
    for (unsigned long i = 0; i < 6; ++i) {
        MemoryPacket request;
        memset(&request, 0, sizeof(request));
        request.id = i;
        request.address = 0x1000 + i * 8;
        channel.SendRequest(id, &request);
    }

    // Everything comes back, in order, through the small buffers.
    unsigned long expected = 0;
    for (int cycle = 0; cycle < 64 && expected < 6; ++cycle) {
        channel.Clock();
        memory.Clock();
        channel.PosClock();
        memory.PosClock();

        MemoryPacket response;
        while (channel.ReceiveResponse(id, &response) == 0) {
            if (response.id != expected ||
                response.address != 0x1000 + expected * 8 ||
                response.data != MemoryDataFor(response.address)) {
                CAMSIM_ERROR_PRINTF(
                    "TestBufferedChannel %s:%d bad response %lu\n", __FILE__,
                    __LINE__, response.id);
                return 1;
            }
            ++expected;
        }
    }

    if (expected != 6 || channel.IsBusy() || memory.IsBusy()) {
        CAMSIM_ERROR_PRINTF("TestBufferedChannel %s:%d got %lu of 6\n",
                            __FILE__, __LINE__, expected);
        return 1;
    }

    BufferedChannel broken;
    yaml::Parser brokenParser;
    if (broken.Configure(CreateFakeConfig(&brokenParser,
                                          "sendTo: *memory\n"
                                          "requestBufferDepth: 0\n",
                                          &aliases)) == 0) {
        CAMSIM_ERROR_PRINTF("TestBufferedChannel %s:%d took depth 0\n",
                            __FILE__, __LINE__);
        return 1;
    }

    return 0;
}

#endif  // NDEBUG
