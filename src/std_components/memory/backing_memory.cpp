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
 * @file backing_memory.cpp
 * @brief Implementation of the BackingMemory.
 */

#include "backing_memory.hpp"

BackingMemory::BackingMemory()
    : cycle(0),
      latency(0),
      throughput(0),
      nonCacheableBase(0),
      nonCacheableSize(0),
      nextConnection(0),
      statRequests(0),
      statNonCacheable(0),
      statBlocked(0) {}

int BackingMemory::Configure(Config config) {
    long latency = 0;
    if (config.Integer("latency", &latency)) return 1;
    if (latency < 0) return config.Error("latency", "is not >= 0.");
    this->latency = latency;

    long throughput = 0;
    if (config.Integer("throughput", &throughput)) return 1;
    if (throughput < 0) return config.Error("throughput", "is not >= 0.");
    this->throughput = throughput;

    long base = 0;
    long size = 0;
    if (config.Integer("nonCacheableBase", &base)) return 1;
    if (config.Integer("nonCacheableSize", &size)) return 1;
    if (size < 0) return config.Error("nonCacheableSize", "is not >= 0.");
    this->nonCacheableBase = base;
    this->nonCacheableSize = size;

    return this->pending.Allocate(0, sizeof(Pending));
}

void BackingMemory::Accept() {
    const long connections = this->GetNumberOfConnections();
    if (connections == 0) return;

    unsigned long accepted = 0;
    bool tookAny = true;
    // One request per connection per pass, so a busy connection doesn't
    // starve the others.
    while (tookAny) {
        tookAny = false;
        for (long i = 0; i < connections; ++i) {
            if (this->throughput != 0 && accepted == this->throughput) return;

            const int connection = (this->nextConnection + i) % connections;
            Pending entry;
            if (this->ReceiveRequestFromConnection(connection,
                                                   &entry.response))
                continue;

            entry.response.data = MemoryDataFor(entry.response.address);
            entry.response.nonCacheable =
                this->IsNonCacheable(entry.response.address);
            entry.readyAt = this->cycle + this->latency;
            entry.connection = connection;
            if (this->pending.Enqueue(&entry)) {
                CAMSIM_ERROR_PRINTF(
                    "BackingMemory %p: dropped request %lu, out of memory.\n",
                    (void*)this, entry.response.id);
                continue;
            }

            ++this->statRequests;
            if (entry.response.nonCacheable) ++this->statNonCacheable;
            ++accepted;
            tookAny = true;
        }
    }
}

void BackingMemory::Respond() {
    Pending entry;
    while (this->pending.Peek(&entry) == 0 && entry.readyAt <= this->cycle) {
        if (this->SendResponseToConnection(entry.connection,
                                           &entry.response)) {
            ++this->statBlocked;
            return;
        }
        this->pending.Dequeue(&entry);
    }
}

void BackingMemory::Clock() {
    this->Accept();
    this->Respond();

    const long connections = this->GetNumberOfConnections();
    if (connections > 0)
        this->nextConnection = (this->nextConnection + 1) % connections;
    ++this->cycle;
}

bool BackingMemory::IsBusy() {
    return !this->pending.IsEmpty() || this->HasPendingMessages();
}

void BackingMemory::PrintStatistics() {
    CAMSIM_LOG_PRINTF(
        "BackingMemory %p:\n\tRequests: %lu\n\tNon-cacheable: %lu\n\tBlocked "
        "cycles: %lu\n",
        (void*)this, this->statRequests, this->statNonCacheable,
        this->statBlocked);
}

BackingMemory::~BackingMemory() { this->pending.Deallocate(); }

#ifndef NDEBUG

static void Step(BackingMemory* memory) {
    memory->Clock();
    memory->PosClock();
}

int TestBackingMemory() {
    BackingMemory memory;
    yaml::Parser parser;
    if (memory.Configure(CreateFakeConfig(&parser,
                                          "latency: 3\n"
                                          "throughput: 1\n"
                                          "nonCacheableBase: 0x100\n"
                                          "nonCacheableSize: 0x10\n",
                                          NULL))) {
        CAMSIM_ERROR_PRINTF("TestBackingMemory %s:%d configure failed\n",
                            __FILE__, __LINE__);
        return 1;
    }

    const int id = memory.Connect(4);
    MemoryPacket a;
    MemoryPacket b;
    memset(&a, 0, sizeof(a));
    memset(&b, 0, sizeof(b));
    a.id = 1;
    a.address = 0x20;
    b.id = 2;
    b.address = 0x108;
    memory.SendRequest(id, &a);
    memory.SendRequest(id, &b);
    Step(&memory);  // Requests become visible.

    // With throughput 1, a is taken at cycle 1 and b at cycle 2. Each comes
    // back 3 cycles after being taken.
    int arrivedAt[2] = {-1, -1};
    MemoryPacket response;
    for (int cycle = 1; cycle < 12; ++cycle) {
        Step(&memory);
        while (memory.ReceiveResponse(id, &response) == 0) {
            if (response.id < 1 || response.id > 2) {
                CAMSIM_ERROR_PRINTF("TestBackingMemory %s:%d bad id %lu\n",
                                    __FILE__, __LINE__, response.id);
                return 1;
            }
            arrivedAt[response.id - 1] = cycle;
            if (response.data != MemoryDataFor(response.address) ||
                response.nonCacheable != (response.id == 2)) {
                CAMSIM_ERROR_PRINTF("TestBackingMemory %s:%d bad response\n",
                                    __FILE__, __LINE__);
                return 1;
            }
        }
    }

    if (arrivedAt[0] != 4 || arrivedAt[1] != 5) {
        CAMSIM_ERROR_PRINTF(
            "TestBackingMemory %s:%d responses arrived at %d and %d\n",
            __FILE__, __LINE__, arrivedAt[0], arrivedAt[1]);
        return 1;
    }
    if (memory.IsBusy()) {
        CAMSIM_ERROR_PRINTF("TestBackingMemory %s:%d still busy\n", __FILE__,
                            __LINE__);
        return 1;
    }

    BackingMemory broken;
    yaml::Parser brokenParser;
    if (broken.Configure(
            CreateFakeConfig(&brokenParser, "latency: -1\n", NULL)) == 0) {
        CAMSIM_ERROR_PRINTF("TestBackingMemory %s:%d took a negative latency\n",
                            __FILE__, __LINE__);
        return 1;
    }

    return 0;
}

#endif  // NDEBUG
