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
 * @file cached_channel.cpp
 * @brief Implementation of the CachedChannel component.
 */

#include "cached_channel.hpp"

#include <climits>
#include <cstdio>

CachedChannel::CachedChannel()
    : channel(NULL),
      sendTo(NULL),
      sendToId(-1),
      nextConnection(0),
      writePending(false),
      resetPending(false) {
    memset(&this->write, 0, sizeof(this->write));
}

static int CheckRange(Config* config, const char* parameter, long value,
                      long min) {
    if (value >= min && value <= INT_MAX) return 0;
    char reason[64];
    snprintf(reason, sizeof(reason), "is not between %ld and %d.", min,
             INT_MAX);
    return config->Error(parameter, reason);
}

static int CheckPolicy(Config* config, const char* parameter,
                       const char* name, long sets, long ways) {
    ReplacementPolicyFactory factory = GetReplacementPolicyFactory(name);
    if (factory == NULL)
        return config->Error(parameter, "is not a replacement policy.");
    ReplacementPolicy* policy =
        factory(static_cast<int>(sets), static_cast<int>(ways));
    if (policy == NULL)
        return config->Error(parameter, "does not fit the number of ways.");
    delete policy;
    return 0;
}

int CachedChannel::Configure(Config config) {
    if (config.ComponentReference("sendTo", &this->sendTo, true)) return 1;

    long ways = 4;
    long sets = 1;
    long camWays = 8;
    long responseBufferDepth = 16;
    long downstreamBufferSize = 1;
    const char* policy = "plru";
    const char* camPolicy = "plru";

    if (config.Integer("ways", &ways)) return 1;
    if (config.Integer("sets", &sets)) return 1;
    if (config.String("policy", &policy)) return 1;
    if (config.Integer("camWays", &camWays)) return 1;
    if (config.String("camPolicy", &camPolicy)) return 1;
    if (config.Integer("responseBufferDepth", &responseBufferDepth)) return 1;
    if (config.Integer("downstreamBufferSize", &downstreamBufferSize))
        return 1;

    if (CheckRange(&config, "ways", ways, 2)) return 1;
    if (CheckRange(&config, "sets", sets, 1)) return 1;
    if (!IsPowerOfTwo(sets))
        return config.Error("sets", "is not a power of two.");
    if (sets * ways > INT_MAX)
        return config.Error("sets", "times ways is too large.");
    if (CheckRange(&config, "camWays", camWays, 2)) return 1;
    if (CheckRange(&config, "responseBufferDepth", responseBufferDepth, 1))
        return 1;
    if (CheckRange(&config, "downstreamBufferSize", downstreamBufferSize, 0))
        return 1;
    if (CheckPolicy(&config, "policy", policy, sets, ways)) return 1;
    if (CheckPolicy(&config, "camPolicy", camPolicy, 1, camWays)) return 1;

    this->channel = CachedRequestResponseChannel::New(
        static_cast<int>(ways), static_cast<int>(sets), policy,
        static_cast<int>(camWays), camPolicy,
        static_cast<int>(responseBufferDepth));
    if (this->channel == NULL) return 1;

    this->sendToId =
        this->sendTo->Connect(static_cast<int>(downstreamBufferSize));
    if (this->sendToId < 0) return 1;

    return 0;
}

void CachedChannel::WriteCache(unsigned long address, unsigned long data,
                               bool invalidate) {
    this->write.address = address;
    this->write.data = data;
    this->write.invalidate = invalidate;
    this->writePending = true;
}

void CachedChannel::ResetCache() { this->resetPending = true; }

int CachedChannel::PickUpstream(MemoryPacket* request) {
    const long connections = this->GetNumberOfConnections();
    for (long i = 0; i < connections; ++i) {
        const int connection = (this->nextConnection + i) % connections;
        if (this->PeekRequestFromConnection(connection, request) == 0 &&
            this->router.CanClaim(request->id, connection))
            return connection;
    }
    return -1;
}

void CachedChannel::Clock() {
    ChannelInputs in;
    ChannelOutputs out;

    const int upstream = this->PickUpstream(&in.upstreamRequest);
    in.upstreamRequestValid = upstream >= 0;
    in.downstreamRequestReady = this->sendTo->CanSendRequest(this->sendToId);
    in.downstreamResponseValid =
        this->sendTo->PeekResponse(this->sendToId, &in.downstreamResponse) == 0;

    MemoryPacket head;
    int owner = -1;
    if (this->channel->PeekResponse(&head) == 0) {
        owner = this->router.Owner(head.id);
        if (owner < 0) {
            CAMSIM_WARNING_PRINTF(
                "CachedChannel %p: no connection to answer id %lu, dropping "
                "the response.\n",
                (void*)this, head.id);
            in.upstreamResponseReady = true;
        } else {
            in.upstreamResponseReady =
                this->CanSendResponseToConnection(owner);
        }
    }

    in.cacheWriteValid = this->writePending;
    in.cacheWrite = this->write;
    in.resetCache = this->resetPending;
    this->writePending = false;
    this->resetPending = false;

    this->channel->Clock(&in, &out);

    if (in.upstreamRequestValid && out.upstreamRequestReady) {
        MemoryPacket request;
        this->ReceiveRequestFromConnection(upstream, &request);
        this->router.Claim(request.id, upstream);
        this->nextConnection = upstream + 1;
    }

    if (out.downstreamRequestValid &&
        this->sendTo->SendRequest(this->sendToId, &out.downstreamRequest)) {
        CAMSIM_ERROR_PRINTF(
            "CachedChannel %p: downstream refused request %lu after being "
            "ready.\n",
            (void*)this, out.downstreamRequest.id);
    }

    if (in.downstreamResponseValid && out.downstreamResponseReady) {
        MemoryPacket response;
        this->sendTo->ReceiveResponse(this->sendToId, &response);
    }

    if (out.upstreamResponseValid && in.upstreamResponseReady && owner >= 0) {
        if (this->SendResponseToConnection(owner, &out.upstreamResponse)) {
            CAMSIM_ERROR_PRINTF(
                "CachedChannel %p: connection %d refused response %lu after "
                "being ready.\n",
                (void*)this, owner, out.upstreamResponse.id);
        }
        this->router.Release(out.upstreamResponse.id);
    }
}

void CachedChannel::PosClock() {
    this->channel->PosClock();
    Linkable::PosClock();
}

bool CachedChannel::IsBusy() {
    return this->channel->IsBusy() || this->HasPendingMessages();
}

void CachedChannel::PrintStatistics() {
    char name[64];
    snprintf(name, sizeof(name), "CachedChannel %p", (void*)this);
    this->channel->PrintStatistics(name);
}

CachedChannel::~CachedChannel() { delete this->channel; }

#ifndef NDEBUG

#include <std_components/memory/backing_memory.hpp>

/** @brief Clocks both components once. */
static void Step(CachedChannel* channel, BackingMemory* memory) {
    channel->Clock();
    memory->Clock();
    channel->PosClock();
    memory->PosClock();
}

static MemoryPacket Request(unsigned long id, unsigned long address) {
    MemoryPacket packet;
    memset(&packet, 0, sizeof(packet));
    packet.id = id;
    packet.address = address;
    return packet;
}

int TestCachedChannelComponent() {
    BackingMemory memory;
    CachedChannel channel;

    Map<Linkable*> aliases;
    yaml::Parser memoryParser;
    yaml::Parser channelParser;
    aliases.Insert("memory", &memory);

    if (memory.Configure(CreateFakeConfig(&memoryParser,
                                          "latency: 2\n"
                                          "nonCacheableBase: 0x1000\n"
                                          "nonCacheableSize: 0x100\n",
                                          &aliases))) {
        CAMSIM_ERROR_PRINTF("TestCachedChannelComponent %s:%d memory config\n",
                            __FILE__, __LINE__);
        return 1;
    }
    if (channel.Configure(CreateFakeConfig(&channelParser,
                                           "sendTo: *memory\n"
                                           "ways: 2\n"
                                           "camWays: 4\n"
                                           "responseBufferDepth: 2\n",
                                           &aliases))) {
        CAMSIM_ERROR_PRINTF("TestCachedChannelComponent %s:%d channel config\n",
                            __FILE__, __LINE__);
        return 1;
    }

    const int left = channel.Connect(2);
    const int right = channel.Connect(2);

    // Both sides miss on different addresses.
    MemoryPacket a = Request(1, 0x40);
    MemoryPacket b = Request(2, 0x80);
    channel.SendRequest(left, &a);
    channel.SendRequest(right, &b);

    MemoryPacket got[2];
    int gotFrom[2];
    int received = 0;
    for (int cycle = 0; cycle < 32 && received < 2; ++cycle) {
        Step(&channel, &memory);
        MemoryPacket response;
        if (channel.ReceiveResponse(left, &response) == 0) {
            got[received] = response;
            gotFrom[received++] = left;
        }
        if (channel.ReceiveResponse(right, &response) == 0) {
            got[received] = response;
            gotFrom[received++] = right;
        }
    }
    if (received != 2) {
        CAMSIM_ERROR_PRINTF("TestCachedChannelComponent %s:%d got %d of 2\n",
                            __FILE__, __LINE__, received);
        return 1;
    }
    for (int i = 0; i < 2; ++i) {
        const int expected = got[i].id == 1 ? left : right;
        if (gotFrom[i] != expected ||
            got[i].data != MemoryDataFor(got[i].address)) {
            CAMSIM_ERROR_PRINTF(
                "TestCachedChannelComponent %s:%d id %lu routed badly\n",
                __FILE__, __LINE__, got[i].id);
            return 1;
        }
    }

    // 0x40 is cached now. Hits never reach the memory.
    const unsigned long before = channel.GetChannel()->GetStatMisses();
    MemoryPacket c = Request(3, 0x40);
    channel.SendRequest(right, &c);
    MemoryPacket response;
    bool answered = false;
    for (int cycle = 0; cycle < 8 && !answered; ++cycle) {
        Step(&channel, &memory);
        answered = channel.ReceiveResponse(right, &response) == 0;
    }
    if (!answered || response.id != 3 ||
        response.data != MemoryDataFor(0x40) ||
        channel.GetChannel()->GetStatMisses() != before) {
        CAMSIM_ERROR_PRINTF("TestCachedChannelComponent %s:%d hit failed\n",
                            __FILE__, __LINE__);
        return 1;
    }

    // Non-cacheable data is forwarded but not kept.
    MemoryPacket d = Request(4, 0x1010);
    channel.SendRequest(left, &d);
    answered = false;
    for (int cycle = 0; cycle < 16 && !answered; ++cycle) {
        Step(&channel, &memory);
        answered = channel.ReceiveResponse(left, &response) == 0;
    }
    if (!answered || !response.nonCacheable ||
        response.data != MemoryDataFor(0x1010)) {
        CAMSIM_ERROR_PRINTF(
            "TestCachedChannelComponent %s:%d non-cacheable response\n",
            __FILE__, __LINE__);
        return 1;
    }
    const AssociativeCache<unsigned long>* cache =
        channel.GetChannel()->GetCache();
    for (int way = 0; way < cache->GetNumWays(); ++way) {
        unsigned long tag;
        if (cache->GetLine(0, way, &tag, NULL) && tag == 0x1010) {
            CAMSIM_ERROR_PRINTF(
                "TestCachedChannelComponent %s:%d non-cacheable cached\n",
                __FILE__, __LINE__);
            return 1;
        }
    }

    // A reset through the component empties the cache.
    channel.ResetCache();
    Step(&channel, &memory);
    if (!cache->IsEmpty()) {
        CAMSIM_ERROR_PRINTF("TestCachedChannelComponent %s:%d reset ignored\n",
                            __FILE__, __LINE__);
        return 1;
    }

    // And a write puts a line back.
    channel.WriteCache(0x200, 77, false);
    Step(&channel, &memory);
    unsigned long tag = 0;
    unsigned long data = 0;
    bool found = false;
    for (int way = 0; way < cache->GetNumWays(); ++way) {
        if (cache->GetLine(0, way, &tag, &data) && tag == 0x200 && data == 77)
            found = true;
    }
    if (!found) {
        CAMSIM_ERROR_PRINTF("TestCachedChannelComponent %s:%d write ignored\n",
                            __FILE__, __LINE__);
        return 1;
    }

    if (channel.IsBusy()) {
        CAMSIM_ERROR_PRINTF("TestCachedChannelComponent %s:%d still busy\n",
                            __FILE__, __LINE__);
        return 1;
    }

    return 0;
}

int TestCachedChannelConfigErrors() {
    const char* broken[] = {
        "sendTo: *memory\nways: 1\n",
        "sendTo: *memory\nways: 4294967298\n",
        "sendTo: *memory\nsets: 3\n",
        "sendTo: *memory\nsets: 4294967296\n",
        "sendTo: *memory\npolicy: mru\n",
        "sendTo: *memory\nways: 6\npolicy: plru\n",
        "sendTo: *memory\ncamWays: 4294967300\n",
        "sendTo: *memory\ncamPolicy: mru\n",
        "sendTo: *memory\nresponseBufferDepth: 0\n",
        "sendTo: *memory\nresponseBufferDepth: 4294967297\n",
        "sendTo: *memory\ndownstreamBufferSize: -1\n",
    };
    const int numBroken = sizeof(broken) / sizeof(broken[0]);

    BackingMemory memory;
    Map<Linkable*> aliases;
    aliases.Insert("memory", &memory);

    for (int i = 0; i < numBroken; ++i) {
        CachedChannel channel;
        yaml::Parser parser;
        if (channel.Configure(CreateFakeConfig(&parser, broken[i], &aliases)) ==
            0) {
            CAMSIM_ERROR_PRINTF(
                "TestCachedChannelConfigErrors %s:%d accepted:\n%s", __FILE__,
                __LINE__, broken[i]);
            return 1;
        }
    }

    CachedChannel channel;
    yaml::Parser parser;
    if (channel.Configure(CreateFakeConfig(&parser,
                                           "sendTo: *memory\n"
                                           "ways: 6\n"
                                           "policy: lru\n"
                                           "sets: 4\n"
                                           "camWays: 6\n"
                                           "camPolicy: available\n",
                                           &aliases))) {
        CAMSIM_ERROR_PRINTF("TestCachedChannelConfigErrors %s:%d refused\n",
                            __FILE__, __LINE__);
        return 1;
    }

    return 0;
}

#endif  // NDEBUG
