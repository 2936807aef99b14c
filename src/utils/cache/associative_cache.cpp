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
 * @file associative_cache.cpp
 * @brief Tests of the AssociativeCache template.
 */

#include "associative_cache.hpp"

#ifndef NDEBUG

#include <map>
#include <random>

typedef AssociativeCache<unsigned long> TestCache;

static int Failed(const char* test, int line, const char* what) {
    CAMSIM_ERROR_PRINTF("%s %s:%d %s\n", test, __FILE__, line, what);
    return 1;
}

static void Step(TestCache* cache) {
    cache->Clock();
    cache->PosClock();
}

static void FillStep(TestCache* cache, unsigned long address,
                     unsigned long data) {
    cache->Fill(0, address, data, true);
    Step(cache);
}

int TestAssociativeCacheScenarios() {
    const char* test = "TestAssociativeCacheScenarios";
    TestCache* cache =
        TestCache::New(1, 4, 1, 1, 1, GetReplacementPolicyFactory("plru"));
    if (cache == NULL) return Failed(test, __LINE__, "New failed");

    unsigned long data = 0;
    unsigned long address = 0;
    int ret = 0;

    // A fill on an empty cache is readable the next step.
    FillStep(cache, 0x10, 7);
    if (cache->GetOccupancy() != 1 || cache->IsEmpty())
        ret = Failed(test, __LINE__, "occupancy after one fill");
    if (!cache->Read(0, 0x10, false, &data) || data != 7)
        ret = Failed(test, __LINE__, "0x10 should hold 7");
    Step(cache);

    FillStep(cache, 0x20, 8);
    FillStep(cache, 0x30, 9);
    FillStep(cache, 0x40, 10);
    if (cache->GetOccupancy() != 4 || !cache->IsFull())
        ret = Failed(test, __LINE__, "cache should be full");

    // The fifth fill pushes out the line nobody touched since its fill. The
    // read above happened before 0x20, 0x30 and 0x40 came in.
    cache->Fill(0, 0x50, 11, true);
    cache->Clock();
    if (!cache->FillAccepted(0))
        ret = Failed(test, __LINE__, "fill refused");
    if (!cache->Evicted(0, &address, &data) || address != 0x10 || data != 7)
        ret = Failed(test, __LINE__, "0x10 should be evicted");
    cache->PosClock();

    if (cache->Read(0, 0x10, false, NULL))
        ret = Failed(test, __LINE__, "0x10 still there");
    if (!cache->Read(0, 0x50, false, &data) || data != 11)
        ret = Failed(test, __LINE__, "0x50 should hold 11");
    if (cache->GetOccupancy() != 4)
        ret = Failed(test, __LINE__, "occupancy past capacity");
    Step(cache);

    // A hit right before a miss protects the line.
    if (!cache->Read(0, 0x20, false, NULL))
        ret = Failed(test, __LINE__, "0x20 should hit");
    Step(cache);
    cache->Fill(0, 0x60, 12, true);
    cache->Clock();
    if (cache->Evicted(0, &address, &data) && address == 0x20)
        ret = Failed(test, __LINE__, "recently read line evicted");
    cache->PosClock();

    // Overwriting a present address keeps a single copy.
    FillStep(cache, 0x60, 13);
    int copies = 0;
    for (int way = 0; way < 4; ++way) {
        if (cache->GetLine(0, way, &address, &data) && address == 0x60) {
            copies += 1;
            if (data != 13) ret = Failed(test, __LINE__, "stale overwrite");
        }
    }
    if (copies != 1) ret = Failed(test, __LINE__, "0x60 duplicated");

    delete cache;
    return ret;
}

int TestAssociativeCacheReadInvalidate() {
    const char* test = "TestAssociativeCacheReadInvalidate";
    TestCache* cache =
        TestCache::New(1, 4, 2, 1, 1, GetReplacementPolicyFactory("plru"));
    if (cache == NULL) return Failed(test, __LINE__, "New failed");

    unsigned long data = 0;
    unsigned long address = 0;
    int ret = 0;

    FillStep(cache, 0x10, 7);

    // The data comes back in the same step the line is retired, and another
    // port still sees it during that step.
    if (!cache->Read(0, 0x10, true, &data) || data != 7)
        ret = Failed(test, __LINE__, "read with invalidate missed");
    data = 0;
    if (!cache->Read(1, 0x10, false, &data) || data != 7)
        ret = Failed(test, __LINE__, "line gone before the step ended");
    Step(cache);

    if (cache->Read(1, 0x10, false, NULL))
        ret = Failed(test, __LINE__, "line survived read with invalidate");
    if (!cache->IsEmpty()) ret = Failed(test, __LINE__, "cache not empty");
    Step(cache);

    // Full cache: retiring one line and filling a new address in the same
    // step reuses the retired way without evicting anything live.
    FillStep(cache, 0x10, 1);
    FillStep(cache, 0x20, 2);
    FillStep(cache, 0x30, 3);
    FillStep(cache, 0x40, 4);
    if (!cache->IsFull()) ret = Failed(test, __LINE__, "cache not full");

    if (!cache->Read(0, 0x30, true, &data) || data != 3)
        ret = Failed(test, __LINE__, "0x30 should hit");
    cache->Fill(0, 0x50, 5, true);
    cache->Clock();
    if (!cache->FillAccepted(0))
        ret = Failed(test, __LINE__, "fill refused");
    if (cache->Evicted(0, &address, &data))
        ret = Failed(test, __LINE__, "a live line was evicted");
    cache->PosClock();

    const unsigned long present[] = {0x10, 0x20, 0x40, 0x50};
    for (int i = 0; i < 4; ++i) {
        if (!cache->Read(1, present[i], false, NULL))
            ret = Failed(test, __LINE__, "lost a line");
    }
    if (cache->Read(1, 0x30, false, NULL))
        ret = Failed(test, __LINE__, "0x30 still there");
    if (cache->GetOccupancy() != 4)
        ret = Failed(test, __LINE__, "occupancy wrong");
    Step(cache);

    // Retire and refill the same address: the fill wins.
    if (!cache->Read(0, 0x50, true, NULL))
        ret = Failed(test, __LINE__, "0x50 should hit");
    cache->Fill(0, 0x50, 55, true);
    Step(cache);
    if (!cache->Read(1, 0x50, false, &data) || data != 55)
        ret = Failed(test, __LINE__, "fill lost to read invalidate");
    if (cache->GetOccupancy() != 4)
        ret = Failed(test, __LINE__, "occupancy wrong after refill");
    Step(cache);

    delete cache;
    return ret;
}

int TestAssociativeCacheEmptyWayFirst() {
    const char* test = "TestAssociativeCacheEmptyWayFirst";
    const char* policies[] = {"plru", "lru", "roundrobin", "random",
                              "available"};
    int ret = 0;

    for (int i = 0; i < 5; ++i) {
        TestCache* cache = TestCache::New(
            1, 4, 1, 1, 1, GetReplacementPolicyFactory(policies[i]));
        if (cache == NULL) return Failed(test, __LINE__, policies[i]);

        unsigned long data = 0;
        unsigned long address = 0;

        for (unsigned long line = 0; line < 4; ++line)
            FillStep(cache, line, 100 + line);

        // Retire out of order, so the policy state no longer follows the
        // empty ways.
        if (!cache->Read(0, 3, true, NULL))
            ret = Failed(test, __LINE__, policies[i]);
        Step(cache);
        if (!cache->Read(0, 1, true, NULL))
            ret = Failed(test, __LINE__, policies[i]);
        Step(cache);

        const unsigned long incoming[] = {10, 11};
        for (int j = 0; j < 2; ++j) {
            cache->Fill(0, incoming[j], 200 + incoming[j], true);
            cache->Clock();
            if (!cache->FillAccepted(0))
                ret = Failed(test, __LINE__, policies[i]);
            if (cache->Evicted(0, &address, &data))
                ret = Failed(test, __LINE__, policies[i]);
            cache->PosClock();
        }

        const unsigned long present[] = {0, 2, 10, 11};
        for (int j = 0; j < 4; ++j) {
            unsigned long expected =
                present[j] < 4 ? 100 + present[j] : 200 + present[j];
            if (!cache->Read(0, present[j], false, &data) || data != expected)
                ret = Failed(test, __LINE__, policies[i]);
        }
        Step(cache);
        if (!cache->IsFull() || cache->GetStatEvictions() != 0)
            ret = Failed(test, __LINE__, policies[i]);

        delete cache;
    }

    return ret;
}

static char policyEvents[64];
static int numPolicyEvents = 0;

/** @brief Always points at way 0 and writes down what it's told. */
class RecordingPolicy : public ReplacementPolicy {
  public:
    RecordingPolicy(int numSets, int numWays)
        : ReplacementPolicy(numSets, numWays) {}

    static ReplacementPolicy* New(int numSets, int numWays) {
        return new RecordingPolicy(numSets, numWays);
    }

    virtual void Hit(int, int way) { this->Record('H', way); }
    virtual void Invalidate(int, int way) { this->Record('I', way); }
    virtual int Allocate(int) const { return 0; }
    virtual void Allocated(int, int way) { this->Record('A', way); }
    virtual void Reset() {}

  private:
    void Record(char event, int way) {
        if (numPolicyEvents + 3 > static_cast<int>(sizeof(policyEvents)))
            return;
        policyEvents[numPolicyEvents++] = event;
        policyEvents[numPolicyEvents++] = static_cast<char>('0' + way);
        policyEvents[numPolicyEvents] = '\0';
    }
};

static void ClearPolicyEvents() {
    numPolicyEvents = 0;
    policyEvents[0] = '\0';
}

int TestAssociativeCachePolicyEvents() {
    const char* test = "TestAssociativeCachePolicyEvents";
    TestCache* cache = TestCache::New(1, 4, 2, 1, 0, RecordingPolicy::New);
    if (cache == NULL) return Failed(test, __LINE__, "New failed");

    int ret = 0;

    // Way 0 is taken, so the second fill goes to the lowest empty way.
    ClearPolicyEvents();
    FillStep(cache, 0x10, 1);
    FillStep(cache, 0x20, 2);
    if (strcmp(policyEvents, "A0A1") != 0)
        ret = Failed(test, __LINE__, policyEvents);

    // A read that retires its line is a hit and then an invalidate, folded
    // before the plain hits of the step.
    ClearPolicyEvents();
    cache->Read(1, 0x20, false, NULL);
    cache->Read(0, 0x10, true, NULL);
    Step(cache);
    if (strcmp(policyEvents, "H0I0H1") != 0)
        ret = Failed(test, __LINE__, policyEvents);

    // Way 0 is empty again and the policy points at it.
    ClearPolicyEvents();
    FillStep(cache, 0x30, 3);
    if (strcmp(policyEvents, "A0") != 0)
        ret = Failed(test, __LINE__, policyEvents);

    delete cache;
    return ret;
}

int TestAssociativeCacheInvalidate() {
    const char* test = "TestAssociativeCacheInvalidate";
    TestCache* cache =
        TestCache::New(1, 2, 1, 1, 1, GetReplacementPolicyFactory("plru"));
    if (cache == NULL) return Failed(test, __LINE__, "New failed");

    unsigned long data = 0;
    unsigned long address = 0;
    int ret = 0;

    // Absent address: nothing happens.
    cache->Fill(0, 0x77, 0, false);
    cache->Clock();
    if (!cache->FillAccepted(0) || cache->Evicted(0, &address, &data))
        ret = Failed(test, __LINE__, "invalidate of absent address");
    cache->PosClock();
    if (!cache->IsEmpty() || cache->Read(0, 0x77, false, NULL))
        ret = Failed(test, __LINE__, "absent address appeared");
    Step(cache);

    // Present address: removed and reported.
    FillStep(cache, 0x77, 3);
    cache->Fill(0, 0x77, 0, false);
    cache->Clock();
    if (!cache->Evicted(0, &address, &data) || address != 0x77 || data != 3)
        ret = Failed(test, __LINE__, "removed line not reported");
    cache->PosClock();
    if (cache->Read(0, 0x77, false, NULL))
        ret = Failed(test, __LINE__, "invalidated line still hits");

    // Again: a no-op.
    Step(cache);
    cache->Fill(0, 0x77, 0, false);
    cache->Clock();
    if (cache->Evicted(0, &address, &data))
        ret = Failed(test, __LINE__, "second invalidate reported a line");
    cache->PosClock();
    if (!cache->IsEmpty()) ret = Failed(test, __LINE__, "occupancy changed");
    if (cache->GetStatInvalidations() != 1)
        ret = Failed(test, __LINE__, "invalidations miscounted");

    delete cache;
    return ret;
}

int TestAssociativeCachePorts() {
    const char* test = "TestAssociativeCachePorts";
    ReplacementPolicyFactory roundRobin =
        GetReplacementPolicyFactory("roundrobin");
    TestCache* cache = TestCache::New(1, 4, 2, 2, 2, roundRobin);
    if (cache == NULL) return Failed(test, __LINE__, "New failed");

    unsigned long data = 0;
    unsigned long address = 0;
    int ret = 0;

    // Two misses in one step get two different ways.
    cache->Fill(0, 0x10, 1, true);
    cache->Fill(1, 0x20, 2, true);
    cache->Clock();
    if (!cache->FillAccepted(0) || !cache->FillAccepted(1))
        ret = Failed(test, __LINE__, "parallel fills refused");
    cache->PosClock();
    if (cache->GetOccupancy() != 2)
        ret = Failed(test, __LINE__, "parallel fills collided");

    // The same address twice: the lower port wins.
    cache->Fill(0, 0x30, 3, true);
    cache->Fill(1, 0x30, 4, true);
    cache->Clock();
    if (!cache->FillAccepted(0) || cache->FillAccepted(1))
        ret = Failed(test, __LINE__, "repeated address not refused");
    cache->PosClock();
    if (!cache->Read(0, 0x30, false, &data) || data != 3)
        ret = Failed(test, __LINE__, "0x30 should hold 3");
    if (cache->GetOccupancy() != 3)
        ret = Failed(test, __LINE__, "repeated address stored twice");
    Step(cache);

    FillStep(cache, 0x40, 4);
    // Round robin points back at 0x10. Updating 0x10 claims that way, so a
    // miss on another port has to wait.
    cache->Fill(0, 0x10, 11, true);
    cache->Fill(1, 0x50, 5, true);
    cache->Clock();
    if (!cache->FillAccepted(0) || cache->FillAccepted(1))
        ret = Failed(test, __LINE__, "claimed way given to a miss");
    if (cache->Evicted(1, &address, &data))
        ret = Failed(test, __LINE__, "refused fill evicted");
    cache->PosClock();

    // The retry goes through.
    cache->Fill(1, 0x50, 5, true);
    cache->Clock();
    if (!cache->FillAccepted(1))
        ret = Failed(test, __LINE__, "retry refused");
    if (!cache->Evicted(1, &address, &data) || address != 0x10 || data != 11)
        ret = Failed(test, __LINE__, "retry should evict 0x10");
    if (cache->Evicted(0, &address, &data))
        ret = Failed(test, __LINE__, "idle port evicted");
    cache->PosClock();

    // Reads on both ports in the same step.
    if (!cache->Read(0, 0x20, false, &data) || data != 2)
        ret = Failed(test, __LINE__, "port 0 read");
    if (!cache->Read(1, 0x50, false, &data) || data != 5)
        ret = Failed(test, __LINE__, "port 1 read");
    Step(cache);

    delete cache;
    return ret;
}

int TestAssociativeCacheSets() {
    const char* test = "TestAssociativeCacheSets";
    TestCache* cache =
        TestCache::New(4, 2, 1, 1, 1, GetReplacementPolicyFactory("lru"));
    if (cache == NULL) return Failed(test, __LINE__, "New failed");

    unsigned long data = 0;
    unsigned long address = 0;
    int ret = 0;

    // 0, 4 and 8 share set 0, 1 lives in set 1.
    FillStep(cache, 0, 100);
    FillStep(cache, 4, 104);
    FillStep(cache, 1, 101);
    if (cache->GetOccupancy() != 3 || cache->IsFull())
        ret = Failed(test, __LINE__, "occupancy wrong");

    cache->Fill(0, 8, 108, true);
    cache->Clock();
    if (!cache->Evicted(0, &address, &data) || address != 0 || data != 100)
        ret = Failed(test, __LINE__, "set 0 should lose address 0");
    cache->PosClock();

    if (cache->Read(0, 0, false, NULL))
        ret = Failed(test, __LINE__, "address 0 still there");
    if (!cache->Read(0, 4, false, &data) || data != 104)
        ret = Failed(test, __LINE__, "address 4 lost");
    if (!cache->Read(0, 8, false, &data) || data != 108)
        ret = Failed(test, __LINE__, "address 8 lost");
    if (!cache->Read(0, 1, false, &data) || data != 101)
        ret = Failed(test, __LINE__, "set 1 disturbed");
    Step(cache);

    delete cache;
    return ret;
}

int TestAssociativeCacheReset() {
    const char* test = "TestAssociativeCacheReset";
    TestCache* cache =
        TestCache::New(1, 4, 1, 1, 0, GetReplacementPolicyFactory("plru"));
    if (cache == NULL) return Failed(test, __LINE__, "New failed");

    unsigned long data = 0;
    unsigned long address = 0;
    int ret = 0;

    FillStep(cache, 0x10, 1);
    FillStep(cache, 0x20, 2);

    // Lines stay readable in the step the reset is asked for, and the fill
    // of that step is dropped.
    cache->ScheduleReset();
    if (!cache->Read(0, 0x10, false, &data) || data != 1)
        ret = Failed(test, __LINE__, "line gone before the reset step ended");
    cache->Fill(0, 0x30, 3, true);
    cache->Clock();
    if (cache->FillAccepted(0))
        ret = Failed(test, __LINE__, "fill accepted during reset");
    cache->PosClock();

    if (!cache->IsEmpty() || cache->Read(0, 0x10, false, NULL) ||
        cache->Read(0, 0x30, false, NULL))
        ret = Failed(test, __LINE__, "reset left lines behind");
    Step(cache);

    // The policy is back to its first choice.
    FillStep(cache, 0x40, 4);
    if (!cache->GetLine(0, 3, &address, &data) || address != 0x40)
        ret = Failed(test, __LINE__, "policy not reset");

    delete cache;
    return ret;
}

int TestAssociativeCacheErrors() {
    const char* test = "TestAssociativeCacheErrors";
    ReplacementPolicyFactory plru = GetReplacementPolicyFactory("plru");
    ReplacementPolicyFactory lru = GetReplacementPolicyFactory("lru");

    if (TestCache::New(1, 1, 1, 1, 0, lru) != NULL)
        return Failed(test, __LINE__, "accepted one way");
    if (TestCache::New(3, 4, 1, 1, 0, lru) != NULL)
        return Failed(test, __LINE__, "accepted three sets");
    if (TestCache::New(1, 4, 0, 1, 0, lru) != NULL)
        return Failed(test, __LINE__, "accepted no read port");
    if (TestCache::New(1, 4, 1, 0, 0, lru) != NULL)
        return Failed(test, __LINE__, "accepted no fill port");
    if (TestCache::New(1, 4, 1, 1, 2, lru) != NULL)
        return Failed(test, __LINE__, "accepted unpaired eviction ports");
    if (TestCache::New(1, 4, 1, 1, 0, NULL) != NULL)
        return Failed(test, __LINE__, "accepted no policy");
    if (TestCache::New(1, 6, 1, 1, 0, plru) != NULL)
        return Failed(test, __LINE__, "plru accepted six ways");

    TestCache* cache = TestCache::New(1, 6, 1, 2, 2, lru);
    if (cache == NULL) return Failed(test, __LINE__, "lru refused six ways");
    delete cache;
    return 0;
}

/**
 * @brief Random traffic against a map of what the cache should hold. Every
 * eviction must report a line the map has, and after every step the lines
 * must be exactly the map, each tag once.
 */
static int FuzzPolicy(const char* test, const char* policy) {
    const int numSets = 2;
    const int numWays = 4;
    TestCache* cache = TestCache::New(numSets, numWays, 2, 2, 2,
                                      GetReplacementPolicyFactory(policy));
    if (cache == NULL) return Failed(test, __LINE__, policy);

    std::minstd_rand random(1234);
    std::map<unsigned long, unsigned long> model;
    int ret = 0;

    for (int step = 0; step < 4000 && ret == 0; ++step) {
        std::map<unsigned long, unsigned long> before = model;

        bool readEnabled[2];
        bool readInvalidate[2];
        unsigned long readAddress[2];
        for (int port = 0; port < 2; ++port) {
            readEnabled[port] = random() % 2;
            readInvalidate[port] = random() % 3 == 0;
            readAddress[port] = random() % 24;
            if (!readEnabled[port]) continue;

            unsigned long data = 0;
            bool hit = cache->Read(port, readAddress[port],
                                   readInvalidate[port], &data);
            std::map<unsigned long, unsigned long>::iterator it =
                before.find(readAddress[port]);
            if (hit != (it != before.end()) || (hit && data != it->second)) {
                ret = Failed(test, __LINE__, policy);
            }
        }

        bool fillEnabled[2];
        bool fillCommit[2];
        unsigned long fillAddress[2];
        unsigned long fillData[2];
        for (int port = 0; port < 2; ++port) {
            fillEnabled[port] = random() % 4 != 0;
            fillCommit[port] = random() % 5 != 0;
            fillAddress[port] = random() % 24;
            fillData[port] = random();
            if (fillEnabled[port])
                cache->Fill(port, fillAddress[port], fillData[port],
                            fillCommit[port]);
        }

        cache->Clock();

        for (int port = 0; port < 2; ++port) {
            if (readEnabled[port] && readInvalidate[port])
                model.erase(readAddress[port]);
        }
        for (int port = 0; port < 2; ++port) {
            if (!fillEnabled[port] || !cache->FillAccepted(port)) continue;
            unsigned long address;
            unsigned long data;
            if (cache->Evicted(port, &address, &data)) {
                std::map<unsigned long, unsigned long>::iterator it =
                    before.find(address);
                if (it == before.end() || it->second != data) {
                    ret = Failed(test, __LINE__, policy);
                }
                if (!fillCommit[port] && address != fillAddress[port]) {
                    ret = Failed(test, __LINE__, policy);
                }
                model.erase(address);
            }
            if (!fillCommit[port]) model.erase(fillAddress[port]);
        }
        for (int port = 0; port < 2; ++port) {
            if (fillEnabled[port] && fillCommit[port] &&
                cache->FillAccepted(port))
                model[fillAddress[port]] = fillData[port];
        }
        // A lone fill always goes through.
        if (fillEnabled[0] && !fillEnabled[1] && !cache->FillAccepted(0)) {
            ret = Failed(test, __LINE__, policy);
        }
        // A lone miss never pushes a line out of a set that had room.
        if (fillEnabled[0] && fillCommit[0] && !fillEnabled[1] &&
            before.count(fillAddress[0]) == 0) {
            int used = 0;
            std::map<unsigned long, unsigned long>::iterator it;
            for (it = before.begin(); it != before.end(); ++it) {
                if (it->first % numSets == fillAddress[0] % numSets) used += 1;
            }
            unsigned long address;
            unsigned long data;
            if (used < numWays && cache->Evicted(0, &address, &data)) {
                ret = Failed(test, __LINE__, policy);
            }
        }

        cache->PosClock();

        int count = 0;
        for (int set = 0; set < numSets; ++set) {
            for (int way = 0; way < numWays; ++way) {
                unsigned long address;
                unsigned long data;
                if (!cache->GetLine(set, way, &address, &data)) continue;
                count += 1;
                std::map<unsigned long, unsigned long>::iterator it =
                    model.find(address);
                if (it == model.end() || it->second != data ||
                    static_cast<int>(address % numSets) != set) {
                    ret = Failed(test, __LINE__, policy);
                }
            }
        }
        // Tags are unique iff the lines match the map one to one.
        if (count != static_cast<int>(model.size()) ||
            count != cache->GetOccupancy() ||
            count > numSets * numWays ||
            cache->IsFull() != (count == numSets * numWays)) {
            ret = Failed(test, __LINE__, policy);
        }
    }

    delete cache;
    return ret;
}

int TestAssociativeCacheFuzz() {
    const char* policies[] = {"plru", "lru", "roundrobin", "random",
                              "available"};
    for (int i = 0; i < 5; ++i) {
        if (FuzzPolicy("TestAssociativeCacheFuzz", policies[i])) return 1;
    }
    return 0;
}

#endif  // NDEBUG
