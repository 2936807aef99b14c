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
 * @file cached_request_response_channel.cpp
 * @brief Implementation of the CachedRequestResponseChannel.
 */

#include "cached_request_response_channel.hpp"

#include <utils/logging.hpp>

CachedRequestResponseChannel::CachedRequestResponseChannel()
    : cache(NULL),
      tracker(NULL),
      responses(NULL),
      statHits(0),
      statMisses(0),
      statRetired(0),
      statDelivered(0),
      statUnexpected(0),
      statCacheWrites(0),
      statStallResponseBuffer(0),
      statStallTrackerFull(0),
      statStallIdInFlight(0),
      statStallDownstream(0),
      statStallCacheWrite(0) {}

CachedRequestResponseChannel* CachedRequestResponseChannel::New(
    int ways, int sets, const char* policy, int camWays, const char* camPolicy,
    int responseBufferDepth) {
    ReplacementPolicyFactory factory = GetReplacementPolicyFactory(policy);
    if (factory == NULL) {
        CAMSIM_ERROR_PRINTF(
            "CachedRequestResponseChannel: no such policy: %s.\n", policy);
        return NULL;
    }

    AssociativeCache<unsigned long>* cache =
        AssociativeCache<unsigned long>::New(sets, ways, 1, 1, 0, factory);
    if (cache == NULL) return NULL;

    PendingRequestTracker* tracker =
        PendingRequestTracker::New(camWays, camPolicy);
    if (tracker == NULL) {
        delete cache;
        return NULL;
    }

    ReadyValidFifo<MemoryPacket>* responses =
        ReadyValidFifo<MemoryPacket>::New(responseBufferDepth);
    if (responses == NULL) {
        delete cache;
        delete tracker;
        return NULL;
    }

    CachedRequestResponseChannel* channel = new CachedRequestResponseChannel();
    channel->cache = cache;
    channel->tracker = tracker;
    channel->responses = responses;
    return channel;
}

CachedRequestResponseChannel::~CachedRequestResponseChannel() {
    delete this->cache;
    delete this->tracker;
    delete this->responses;
}

void CachedRequestResponseChannel::Clock(const ChannelInputs* inputs,
                                         ChannelOutputs* outputs) {
    *outputs = ChannelOutputs();

    const bool writing = inputs->cacheWriteValid;
    const bool bufferHasRoom = this->responses->CanEnqueue();

    // Downstream response. The tracker entry is only retired when the
    // response is actually taken.
    outputs->downstreamResponseReady = bufferHasRoom && !writing;
    bool respondFromDownstream = false;
    unsigned long pendingAddress = 0;
    if (inputs->downstreamResponseValid && outputs->downstreamResponseReady) {
        respondFromDownstream = this->tracker->Retire(
            inputs->downstreamResponse.id, &pendingAddress);
        if (!respondFromDownstream) {
            CAMSIM_WARNING_PRINTF(
                "CachedRequestResponseChannel: dropping response to id %lu, "
                "nothing was requested with it.\n",
                inputs->downstreamResponse.id);
            this->statUnexpected += 1;
        }
    }

    // Upstream request.
    bool cacheHit = false;
    unsigned long cacheData = 0;
    if (inputs->upstreamRequestValid && !inputs->resetCache) {
        cacheHit = this->cache->Read(0, inputs->upstreamRequest.address, false,
                                     &cacheData);
    }

    bool acceptHit = false;
    bool acceptMiss = false;
    if (inputs->upstreamRequestValid) {
        if (writing) {
            this->statStallCacheWrite += 1;
        } else if (cacheHit) {
            acceptHit = bufferHasRoom && !respondFromDownstream;
            if (!acceptHit) this->statStallResponseBuffer += 1;
        } else {
            const bool trackerHasRoom =
                !this->tracker->IsFull() ||
                (respondFromDownstream &&
                 this->tracker->ReusesInvalidatedWay());
            const bool idInFlight =
                this->tracker->IsInFlight(inputs->upstreamRequest.id);
            acceptMiss = inputs->downstreamRequestReady && trackerHasRoom &&
                         !idInFlight;
            if (!inputs->downstreamRequestReady) {
                this->statStallDownstream += 1;
            } else if (!trackerHasRoom) {
                this->statStallTrackerFull += 1;
            } else if (idInFlight) {
                this->statStallIdInFlight += 1;
            }
        }
    }
    outputs->upstreamRequestReady = acceptHit || acceptMiss;

    if (acceptMiss) {
        outputs->downstreamRequestValid = true;
        outputs->downstreamRequest = inputs->upstreamRequest;
        this->tracker->Insert(inputs->upstreamRequest.id,
                              inputs->upstreamRequest.address);
        this->statMisses += 1;
    }

    // The cache fill port: cache writes first, then downstream responses.
    if (writing) {
        this->cache->Fill(0, inputs->cacheWrite.address,
                          inputs->cacheWrite.data,
                          !inputs->cacheWrite.invalidate);
        this->statCacheWrites += 1;
    } else if (respondFromDownstream &&
               !inputs->downstreamResponse.nonCacheable &&
               !inputs->resetCache) {
        this->cache->Fill(0, pendingAddress, inputs->downstreamResponse.data,
                          true);
    }

    // The response buffer write port: downstream responses first.
    if (respondFromDownstream) {
        MemoryPacket response = inputs->downstreamResponse;
        response.address = pendingAddress;
        this->responses->Enqueue(response);
        this->statRetired += 1;
    } else if (acceptHit) {
        MemoryPacket response = inputs->upstreamRequest;
        response.data = cacheData;
        response.nonCacheable = false;
        this->responses->Enqueue(response);
        this->statHits += 1;
    }

    MemoryPacket head;
    if (this->responses->Peek(&head) == 0) {
        outputs->upstreamResponseValid = true;
        outputs->upstreamResponse = head;
        if (inputs->upstreamResponseReady) {
            this->responses->Dequeue(&head);
            this->statDelivered += 1;
        }
    }

    if (inputs->resetCache) this->cache->ScheduleReset();

    this->cache->Clock();
    this->tracker->Clock();
}

void CachedRequestResponseChannel::PosClock() {
    this->cache->PosClock();
    this->tracker->PosClock();
    this->responses->PosClock();
}

void CachedRequestResponseChannel::PrintStatistics(const char* name) const {
    CAMSIM_LOG_PRINTF(
        "%s:\n\tHits: %lu\n\tMisses: %lu\n\tRetired: %lu\n\tDelivered: "
        "%lu\n\tUnexpected responses: %lu\n\tCache writes: %lu\n",
        name, this->statHits, this->statMisses, this->statRetired,
        this->statDelivered, this->statUnexpected, this->statCacheWrites);
    CAMSIM_LOG_PRINTF(
        "\tStalls:\n\t\tResponse buffer full: %lu\n\t\tTracker full: "
        "%lu\n\t\tId in flight: %lu\n\t\tDownstream busy: %lu\n\t\tCache "
        "write: %lu\n",
        this->statStallResponseBuffer, this->statStallTrackerFull,
        this->statStallIdInFlight, this->statStallDownstream,
        this->statStallCacheWrite);
    this->cache->PrintStatistics("\tCache");
    this->tracker->PrintStatistics("\tPending requests");
}

#ifndef NDEBUG

#include <map>
#include <random>
#include <vector>

static int Failed(const char* test, int line, const char* what) {
    CAMSIM_ERROR_PRINTF("%s %s:%d %s\n", test, __FILE__, line, what);
    return 1;
}

static MemoryPacket Packet(unsigned long id, unsigned long address,
                           unsigned long data) {
    MemoryPacket packet;
    packet.id = id;
    packet.address = address;
    packet.data = data;
    packet.nonCacheable = false;
    return packet;
}

/** @brief Runs a step offering only an upstream request. */
static ChannelOutputs Request(CachedRequestResponseChannel* channel,
                              unsigned long id, unsigned long address) {
    ChannelInputs in;
    ChannelOutputs out;
    in.upstreamRequestValid = true;
    in.upstreamRequest = Packet(id, address, 0);
    in.downstreamRequestReady = true;
    channel->Clock(&in, &out);
    channel->PosClock();
    return out;
}

/** @brief Runs a step offering only a downstream response. */
static ChannelOutputs Respond(CachedRequestResponseChannel* channel,
                              unsigned long id, unsigned long data) {
    ChannelInputs in;
    ChannelOutputs out;
    in.downstreamResponseValid = true;
    in.downstreamResponse = Packet(id, 0, data);
    channel->Clock(&in, &out);
    channel->PosClock();
    return out;
}

/** @brief Runs a step taking the head of the response buffer. */
static ChannelOutputs Consume(CachedRequestResponseChannel* channel) {
    ChannelInputs in;
    ChannelOutputs out;
    in.upstreamResponseReady = true;
    channel->Clock(&in, &out);
    channel->PosClock();
    return out;
}

static bool CacheHolds(CachedRequestResponseChannel* channel,
                       unsigned long address, unsigned long* data) {
    const AssociativeCache<unsigned long>* cache = channel->GetCache();
    for (int set = 0; set < cache->GetNumSets(); ++set) {
        for (int way = 0; way < cache->GetNumWays(); ++way) {
            unsigned long tag;
            if (cache->GetLine(set, way, &tag, data) && tag == address)
                return true;
        }
    }
    return false;
}

int TestCachedChannelMissThenResponse() {
    const char* test = "TestCachedChannelMissThenResponse";
    CachedRequestResponseChannel* channel =
        CachedRequestResponseChannel::New(4, 1, "plru", 2, "plru", 2);
    if (channel == NULL) return Failed(test, __LINE__, "New failed");

    unsigned long data = 0;
    int ret = 0;

    // Empty cache: the request goes downstream and into the tracker.
    ChannelOutputs out = Request(channel, 3, 0x99);
    if (!out.upstreamRequestReady || !out.downstreamRequestValid ||
        out.downstreamRequest.id != 3 || out.downstreamRequest.address != 0x99)
        ret = Failed(test, __LINE__, "miss not forwarded");
    if (channel->GetTracker()->GetOccupancy() != 1)
        ret = Failed(test, __LINE__, "tracker should hold id 3");

    // The response retires the id, fills the cache and is buffered.
    out = Respond(channel, 3, 42);
    if (!out.downstreamResponseReady)
        ret = Failed(test, __LINE__, "response refused");
    if (!channel->GetTracker()->IsEmpty())
        ret = Failed(test, __LINE__, "tracker entry not retired");
    if (!CacheHolds(channel, 0x99, &data) || data != 42)
        ret = Failed(test, __LINE__, "cache not filled");
    if (channel->GetBufferedResponses() != 1)
        ret = Failed(test, __LINE__, "response not buffered");

    out = Consume(channel);
    if (!out.upstreamResponseValid || out.upstreamResponse.id != 3 ||
        out.upstreamResponse.data != 42 ||
        out.upstreamResponse.address != 0x99)
        ret = Failed(test, __LINE__, "wrong upstream response");

    // The same address again is a hit and stays upstream.
    out = Request(channel, 4, 0x99);
    if (!out.upstreamRequestReady || out.downstreamRequestValid)
        ret = Failed(test, __LINE__, "hit forwarded");
    out = Consume(channel);
    if (!out.upstreamResponseValid || out.upstreamResponse.id != 4 ||
        out.upstreamResponse.data != 42)
        ret = Failed(test, __LINE__, "wrong hit response");

    // Nobody asked for id 9: taken and dropped.
    out = Respond(channel, 9, 1);
    if (!out.downstreamResponseReady || channel->GetStatUnexpected() != 1 ||
        channel->GetBufferedResponses() != 0)
        ret = Failed(test, __LINE__, "unexpected response not dropped");

    if (channel->IsBusy()) ret = Failed(test, __LINE__, "still busy");

    delete channel;
    return ret;
}

int TestCachedChannelIdInFlight() {
    const char* test = "TestCachedChannelIdInFlight";
    CachedRequestResponseChannel* channel =
        CachedRequestResponseChannel::New(4, 1, "plru", 2, "plru", 2);
    if (channel == NULL) return Failed(test, __LINE__, "New failed");

    int ret = 0;

    if (!Request(channel, 7, 0x10).upstreamRequestReady)
        ret = Failed(test, __LINE__, "first id 7 refused");

    ChannelOutputs out = Request(channel, 7, 0x20);
    if (out.upstreamRequestReady || out.downstreamRequestValid)
        ret = Failed(test, __LINE__, "second id 7 accepted");

    // Other ids go through.
    if (!Request(channel, 8, 0x30).upstreamRequestReady)
        ret = Failed(test, __LINE__, "id 8 refused");

    // The step that retires id 7 still sees it in flight.
    ChannelInputs in;
    in.upstreamRequestValid = true;
    in.upstreamRequest = Packet(7, 0x20, 0);
    in.downstreamRequestReady = true;
    in.downstreamResponseValid = true;
    in.downstreamResponse = Packet(7, 0, 70);
    channel->Clock(&in, &out);
    channel->PosClock();
    if (!out.downstreamResponseReady || out.upstreamRequestReady)
        ret = Failed(test, __LINE__, "id 7 reused while retiring");

    out = Request(channel, 7, 0x20);
    if (!out.upstreamRequestReady || !out.downstreamRequestValid)
        ret = Failed(test, __LINE__, "retired id 7 refused");

    delete channel;
    return ret;
}

int TestCachedChannelResponseBackpressure() {
    const char* test = "TestCachedChannelResponseBackpressure";
    CachedRequestResponseChannel* channel =
        CachedRequestResponseChannel::New(4, 1, "plru", 2, "plru", 2);
    if (channel == NULL) return Failed(test, __LINE__, "New failed");

    int ret = 0;
    ChannelInputs in;
    ChannelOutputs out;

    Request(channel, 1, 0x10);
    in.upstreamRequestValid = true;
    in.upstreamRequest = Packet(2, 0x20, 0);
    in.downstreamRequestReady = true;
    in.downstreamResponseValid = true;
    in.downstreamResponse = Packet(1, 0, 100);
    channel->Clock(&in, &out);
    channel->PosClock();
    if (!out.upstreamRequestReady || !out.downstreamResponseReady)
        ret = Failed(test, __LINE__, "setup step refused");
    Respond(channel, 2, 200);
    if (channel->GetBufferedResponses() != 2)
        ret = Failed(test, __LINE__, "buffer should be full");

    // Full buffer: a hit waits, and so do downstream responses.
    in = ChannelInputs();
    in.upstreamRequestValid = true;
    in.upstreamRequest = Packet(3, 0x10, 0);
    in.downstreamRequestReady = true;
    channel->Clock(&in, &out);
    channel->PosClock();
    if (out.upstreamRequestReady || out.downstreamRequestValid ||
        out.downstreamResponseReady)
        ret = Failed(test, __LINE__, "hit accepted with a full buffer");
    if (!out.upstreamResponseValid || out.upstreamResponse.id != 1)
        ret = Failed(test, __LINE__, "head should be id 1");

    // Taking the head frees a slot for the next step, not this one.
    in.upstreamResponseReady = true;
    channel->Clock(&in, &out);
    channel->PosClock();
    if (out.upstreamRequestReady)
        ret = Failed(test, __LINE__, "hit accepted in the freeing step");
    if (!out.upstreamResponseValid || out.upstreamResponse.id != 1)
        ret = Failed(test, __LINE__, "id 1 not delivered");

    in.upstreamResponseReady = false;
    channel->Clock(&in, &out);
    channel->PosClock();
    if (!out.upstreamRequestReady)
        ret = Failed(test, __LINE__, "hit refused with room");

    out = Consume(channel);
    if (out.upstreamResponse.id != 2 || out.upstreamResponse.data != 200)
        ret = Failed(test, __LINE__, "id 2 not delivered");
    out = Consume(channel);
    if (out.upstreamResponse.id != 3 || out.upstreamResponse.data != 100)
        ret = Failed(test, __LINE__, "hit response wrong");

    delete channel;
    return ret;
}

static int TrackerFullWithPolicy(const char* test, const char* camPolicy,
                                 bool sameStepReuse) {
    CachedRequestResponseChannel* channel =
        CachedRequestResponseChannel::New(4, 1, "plru", 2, camPolicy, 4);
    if (channel == NULL) return Failed(test, __LINE__, camPolicy);

    int ret = 0;
    ChannelInputs in;
    ChannelOutputs out;
    unsigned long data = 0;

    Request(channel, 1, 0x10);
    Request(channel, 2, 0x20);
    out = Request(channel, 3, 0x30);
    if (out.upstreamRequestReady || out.downstreamRequestValid)
        ret = Failed(test, __LINE__, camPolicy);

    // Retiring id 1 in the same step as the miss of id 3.
    in.upstreamRequestValid = true;
    in.upstreamRequest = Packet(3, 0x30, 0);
    in.downstreamRequestReady = true;
    in.downstreamResponseValid = true;
    in.downstreamResponse = Packet(1, 0, 100);
    in.upstreamResponseReady = true;
    channel->Clock(&in, &out);
    channel->PosClock();
    if (out.upstreamRequestReady != sameStepReuse)
        ret = Failed(test, __LINE__, camPolicy);
    if (!sameStepReuse) {
        out = Request(channel, 3, 0x30);
        if (!out.upstreamRequestReady)
            ret = Failed(test, __LINE__, camPolicy);
    }

    // Both remaining ids are still tracked with their own addresses.
    Respond(channel, 3, 300);
    Respond(channel, 2, 200);
    if (!channel->GetTracker()->IsEmpty())
        ret = Failed(test, __LINE__, camPolicy);
    if (!CacheHolds(channel, 0x20, &data) || data != 200)
        ret = Failed(test, __LINE__, camPolicy);
    if (!CacheHolds(channel, 0x30, &data) || data != 300)
        ret = Failed(test, __LINE__, camPolicy);

    delete channel;
    return ret;
}

int TestCachedChannelTrackerFull() {
    const char* test = "TestCachedChannelTrackerFull";
    if (TrackerFullWithPolicy(test, "plru", true)) return 1;
    if (TrackerFullWithPolicy(test, "available", true)) return 1;
    if (TrackerFullWithPolicy(test, "roundrobin", false)) return 1;

    if (CachedRequestResponseChannel::New(4, 1, "plru", 2, "plru", 0) != NULL ||
        CachedRequestResponseChannel::New(3, 1, "plru", 2, "plru", 2) != NULL ||
        CachedRequestResponseChannel::New(4, 1, "plru", 1, "plru", 2) != NULL ||
        CachedRequestResponseChannel::New(4, 1, "mru", 2, "plru", 2) != NULL)
        return Failed(test, __LINE__, "bad configuration accepted");
    return 0;
}

static int OutOfOrderWithPolicy(const char* test, const char* camPolicy) {
    CachedRequestResponseChannel* channel =
        CachedRequestResponseChannel::New(4, 1, "plru", 4, camPolicy, 16);
    if (channel == NULL) return Failed(test, __LINE__, camPolicy);

    int ret = 0;

    for (unsigned long id = 0; id < 4; ++id) {
        if (!Request(channel, id, 0x100 + id).upstreamRequestReady)
            ret = Failed(test, __LINE__, camPolicy);
    }
    Respond(channel, 3, 3);
    Respond(channel, 1, 1);
    if (channel->GetTracker()->GetOccupancy() != 2)
        ret = Failed(test, __LINE__, camPolicy);

    for (unsigned long id = 10; id < 12; ++id) {
        if (!Request(channel, id, 0x100 + id).upstreamRequestReady)
            ret = Failed(test, __LINE__, camPolicy);
    }
    if (channel->GetTracker()->GetOccupancy() != 4)
        ret = Failed(test, __LINE__, camPolicy);

    // Every id still in flight gets its answer back with its own address.
    const unsigned long ids[] = {0, 2, 10, 11};
    for (int i = 0; i < 4; ++i) {
        if (!Respond(channel, ids[i], ids[i]).downstreamResponseReady)
            ret = Failed(test, __LINE__, camPolicy);
    }
    if (channel->GetStatUnexpected() != 0 ||
        !channel->GetTracker()->IsEmpty() ||
        channel->GetBufferedResponses() != 6)
        ret = Failed(test, __LINE__, camPolicy);

    const unsigned long order[] = {3, 1, 0, 2, 10, 11};
    for (int i = 0; i < 6; ++i) {
        ChannelOutputs out = Consume(channel);
        if (!out.upstreamResponseValid || out.upstreamResponse.id != order[i] ||
            out.upstreamResponse.address != 0x100 + order[i] ||
            out.upstreamResponse.data != order[i])
            ret = Failed(test, __LINE__, camPolicy);
    }

    delete channel;
    return ret;
}

int TestCachedChannelOutOfOrderRetire() {
    const char* test = "TestCachedChannelOutOfOrderRetire";
    const char* policies[] = {"plru", "lru", "roundrobin", "random",
                              "available"};
    for (int i = 0; i < 5; ++i) {
        if (OutOfOrderWithPolicy(test, policies[i])) return 1;
    }
    return 0;
}

int TestCachedChannelCacheWrite() {
    const char* test = "TestCachedChannelCacheWrite";
    CachedRequestResponseChannel* channel =
        CachedRequestResponseChannel::New(4, 1, "plru", 2, "plru", 2);
    if (channel == NULL) return Failed(test, __LINE__, "New failed");

    int ret = 0;
    ChannelInputs in;
    ChannelOutputs out;

    Request(channel, 1, 0x10);

    // A write stalls both the requests and the responses.
    in.cacheWriteValid = true;
    in.cacheWrite.address = 0x40;
    in.cacheWrite.data = 77;
    in.upstreamRequestValid = true;
    in.upstreamRequest = Packet(2, 0x50, 0);
    in.downstreamRequestReady = true;
    in.downstreamResponseValid = true;
    in.downstreamResponse = Packet(1, 0, 100);
    channel->Clock(&in, &out);
    channel->PosClock();
    if (out.upstreamRequestReady || out.downstreamResponseReady ||
        out.downstreamRequestValid)
        ret = Failed(test, __LINE__, "write did not stall the channel");
    if (channel->GetTracker()->IsEmpty())
        ret = Failed(test, __LINE__, "stalled response retired id 1");

    out = Request(channel, 2, 0x40);
    if (!out.upstreamRequestReady || out.downstreamRequestValid)
        ret = Failed(test, __LINE__, "written address missed");
    out = Consume(channel);
    if (out.upstreamResponse.id != 2 || out.upstreamResponse.data != 77)
        ret = Failed(test, __LINE__, "written data not returned");

    // Invalidate it.
    in = ChannelInputs();
    in.cacheWriteValid = true;
    in.cacheWrite.address = 0x40;
    in.cacheWrite.invalidate = true;
    channel->Clock(&in, &out);
    channel->PosClock();

    out = Request(channel, 3, 0x40);
    if (!out.downstreamRequestValid)
        ret = Failed(test, __LINE__, "invalidated address hit");

    delete channel;
    return ret;
}

int TestCachedChannelResetCache() {
    const char* test = "TestCachedChannelResetCache";
    CachedRequestResponseChannel* channel =
        CachedRequestResponseChannel::New(4, 1, "plru", 2, "plru", 2);
    if (channel == NULL) return Failed(test, __LINE__, "New failed");

    int ret = 0;
    unsigned long data = 0;
    ChannelInputs in;
    ChannelOutputs out;

    Request(channel, 1, 0x10);
    Respond(channel, 1, 100);
    Request(channel, 2, 0x20);

    // Hits are ignored while resetting, so 0x10 goes downstream.
    in.resetCache = true;
    in.upstreamRequestValid = true;
    in.upstreamRequest = Packet(3, 0x10, 0);
    in.downstreamRequestReady = true;
    channel->Clock(&in, &out);
    channel->PosClock();
    if (!out.upstreamRequestReady || !out.downstreamRequestValid)
        ret = Failed(test, __LINE__, "hit not forwarded during reset");
    if (!channel->GetCache()->IsEmpty())
        ret = Failed(test, __LINE__, "cache not reset");
    if (channel->GetTracker()->GetOccupancy() != 2 ||
        channel->GetBufferedResponses() != 1)
        ret = Failed(test, __LINE__, "reset touched tracker or buffer");

    // A response arriving during reset is delivered but not kept.
    in = ChannelInputs();
    in.resetCache = true;
    in.downstreamResponseValid = true;
    in.downstreamResponse = Packet(2, 0, 200);
    channel->Clock(&in, &out);
    channel->PosClock();
    if (!out.downstreamResponseReady || CacheHolds(channel, 0x20, &data))
        ret = Failed(test, __LINE__, "filled during reset");
    if (channel->GetBufferedResponses() != 2)
        ret = Failed(test, __LINE__, "response lost during reset");

    delete channel;
    return ret;
}

int TestCachedChannelNonCacheable() {
    const char* test = "TestCachedChannelNonCacheable";
    CachedRequestResponseChannel* channel =
        CachedRequestResponseChannel::New(4, 1, "plru", 2, "plru", 2);
    if (channel == NULL) return Failed(test, __LINE__, "New failed");

    int ret = 0;
    unsigned long data = 0;
    ChannelInputs in;
    ChannelOutputs out;

    Request(channel, 1, 0x50);
    in.downstreamResponseValid = true;
    in.downstreamResponse = Packet(1, 0, 500);
    in.downstreamResponse.nonCacheable = true;
    channel->Clock(&in, &out);
    channel->PosClock();
    if (CacheHolds(channel, 0x50, &data))
        ret = Failed(test, __LINE__, "non cacheable data cached");

    out = Consume(channel);
    if (!out.upstreamResponseValid || !out.upstreamResponse.nonCacheable ||
        out.upstreamResponse.data != 500)
        ret = Failed(test, __LINE__, "non cacheable response lost");

    out = Request(channel, 2, 0x50);
    if (!out.downstreamRequestValid)
        ret = Failed(test, __LINE__, "non cacheable address hit");

    delete channel;
    return ret;
}

struct PendingDownstream {
    MemoryPacket request;
    int readyAt;
};

/**
 * @brief Random requests and a downstream that answers out of order after a
 * random delay. Every accepted request must get exactly one response with
 * the memory contents of its address, and no id may be forwarded twice
 * before it is answered.
 */
int TestCachedChannelFuzz() {
    const char* test = "TestCachedChannelFuzz";
    const int camWays = 4;
    CachedRequestResponseChannel* channel =
        CachedRequestResponseChannel::New(4, 2, "plru", camWays, "plru", 3);
    if (channel == NULL) return Failed(test, __LINE__, "New failed");

    std::minstd_rand random(42);
    std::map<unsigned long, unsigned long> outstanding;  // id -> address
    std::map<unsigned long, bool> forwarded;             // ids downstream
    std::vector<PendingDownstream> downstream;
    bool offering = false;
    MemoryPacket offer = Packet(0, 0, 0);
    int offered = -1;
    unsigned long accepted = 0;
    unsigned long answered = 0;
    int ret = 0;

    for (int cycle = 0; cycle < 20000 && ret == 0; ++cycle) {
        const bool draining = cycle >= 15000;
        ChannelInputs in;
        ChannelOutputs out;

        if (!offering && !draining && random() % 3 != 0) {
            unsigned long id = random() % 8;
            if (outstanding.find(id) == outstanding.end()) {
                offer = Packet(id, random() % 32, 0);
                offering = true;
            }
        }
        in.upstreamRequestValid = offering;
        in.upstreamRequest = offer;
        in.downstreamRequestReady = random() % 4 != 0;
        in.upstreamResponseReady = random() % 10 < 7;
        in.resetCache = random() % 50 == 0;

        offered = -1;
        if (!downstream.empty()) {
            int candidate = random() % downstream.size();
            if (downstream[candidate].readyAt <= cycle) {
                offered = candidate;
                in.downstreamResponseValid = true;
                in.downstreamResponse = downstream[candidate].request;
                in.downstreamResponse.data =
                    MemoryDataFor(downstream[candidate].request.address);
            }
        }

        channel->Clock(&in, &out);
        channel->PosClock();

        if (in.upstreamRequestValid && out.upstreamRequestReady) {
            outstanding[offer.id] = offer.address;
            offering = false;
            accepted += 1;
        }
        if (out.downstreamRequestValid) {
            if (!in.downstreamRequestReady ||
                forwarded.find(out.downstreamRequest.id) != forwarded.end()) {
                ret = Failed(test, __LINE__, "id forwarded twice");
            }
            forwarded[out.downstreamRequest.id] = true;
            PendingDownstream pending;
            pending.request = out.downstreamRequest;
            pending.readyAt = cycle + 1 + random() % 12;
            downstream.push_back(pending);
        }
        if (offered >= 0 && out.downstreamResponseReady) {
            forwarded.erase(downstream[offered].request.id);
            downstream.erase(downstream.begin() + offered);
        }
        if (out.upstreamResponseValid && in.upstreamResponseReady) {
            std::map<unsigned long, unsigned long>::iterator it =
                outstanding.find(out.upstreamResponse.id);
            if (it == outstanding.end()) {
                ret = Failed(test, __LINE__, "response without a request");
            } else if (out.upstreamResponse.data != MemoryDataFor(it->second)) {
                ret = Failed(test, __LINE__, "response with wrong data");
            } else {
                outstanding.erase(it);
                answered += 1;
            }
        }
        if (channel->GetTracker()->GetOccupancy() > camWays)
            ret = Failed(test, __LINE__, "tracker overflow");
        if (channel->GetStatUnexpected() != 0)
            ret = Failed(test, __LINE__, "tracked id overwritten");
    }

    if (ret == 0 && (!outstanding.empty() || channel->IsBusy() ||
                     accepted != answered || accepted == 0))
        ret = Failed(test, __LINE__, "responses lost");
    if (ret == 0 && channel->GetStatHits() == 0)
        ret = Failed(test, __LINE__, "no hits at all");

    delete channel;
    return ret;
}

#endif  // NDEBUG
