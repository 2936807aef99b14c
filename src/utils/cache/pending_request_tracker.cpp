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
 * @file pending_request_tracker.cpp
 * @brief Implementation of the PendingRequestTracker.
 */

#include "pending_request_tracker.hpp"

PendingRequestTracker* PendingRequestTracker::New(int ways,
                                                  const char* policy) {
    ReplacementPolicyFactory factory = GetReplacementPolicyFactory(policy);
    if (factory == NULL) {
        CAMSIM_ERROR_PRINTF("PendingRequestTracker: no such policy: %s.\n",
                            policy);
        return NULL;
    }

    AssociativeCache<unsigned long>* cam =
        AssociativeCache<unsigned long>::New(1, ways, 2, 1, 0, factory);
    if (cam == NULL) return NULL;
    return new PendingRequestTracker(cam);
}

#ifndef NDEBUG

static void Step(PendingRequestTracker* tracker) {
    tracker->Clock();
    tracker->PosClock();
}

static int TestTrackerWithPolicy(const char* policy) {
    PendingRequestTracker* tracker = PendingRequestTracker::New(2, policy);
    if (tracker == NULL) {
        CAMSIM_ERROR_PRINTF("TestPendingRequestTracker %s:%d %s\n", __FILE__,
                            __LINE__, policy);
        return 1;
    }

    unsigned long address = 0;
    int ret = 0;

    tracker->Insert(3, 0x99);
    Step(tracker);
    tracker->Insert(4, 0xaa);
    Step(tracker);
    if (!tracker->IsFull() || !tracker->IsInFlight(3) ||
        tracker->IsInFlight(5)) {
        CAMSIM_ERROR_PRINTF("TestPendingRequestTracker %s:%d %s\n", __FILE__,
                            __LINE__, policy);
        ret = 1;
    }
    Step(tracker);

    // Retire one id and insert another in the same step: the freed way takes
    // the new id and the other request survives.
    if (!tracker->Retire(3, &address) || address != 0x99) {
        CAMSIM_ERROR_PRINTF("TestPendingRequestTracker %s:%d %s\n", __FILE__,
                            __LINE__, policy);
        ret = 1;
    }
    tracker->Insert(5, 0xbb);
    tracker->Clock();
    if (!tracker->InsertAccepted()) {
        CAMSIM_ERROR_PRINTF("TestPendingRequestTracker %s:%d %s\n", __FILE__,
                            __LINE__, policy);
        ret = 1;
    }
    tracker->PosClock();

    if (tracker->Retire(3, &address)) {
        CAMSIM_ERROR_PRINTF(
            "TestPendingRequestTracker %s:%d %s retired twice\n", __FILE__,
            __LINE__, policy);
        ret = 1;
    }
    Step(tracker);
    if (!tracker->Retire(4, &address) || address != 0xaa) {
        CAMSIM_ERROR_PRINTF("TestPendingRequestTracker %s:%d %s lost 4\n",
                            __FILE__, __LINE__, policy);
        ret = 1;
    }
    Step(tracker);
    if (!tracker->Retire(5, &address) || address != 0xbb) {
        CAMSIM_ERROR_PRINTF("TestPendingRequestTracker %s:%d %s lost 5\n",
                            __FILE__, __LINE__, policy);
        ret = 1;
    }
    Step(tracker);
    if (!tracker->IsEmpty()) {
        CAMSIM_ERROR_PRINTF("TestPendingRequestTracker %s:%d %s not empty\n",
                            __FILE__, __LINE__, policy);
        ret = 1;
    }

    delete tracker;
    return ret;
}

// Ids retired out of order leave holes the policy doesn't point at. New ids
// must land in those holes and not on an id still in flight.
static int TestTrackerOutOfOrder(const char* policy) {
    PendingRequestTracker* tracker = PendingRequestTracker::New(4, policy);
    if (tracker == NULL) {
        CAMSIM_ERROR_PRINTF("TestPendingRequestTracker %s:%d %s\n", __FILE__,
                            __LINE__, policy);
        return 1;
    }

    unsigned long address = 0;
    int ret = 0;

    for (unsigned long id = 0; id < 4; ++id) {
        tracker->Insert(id, 0x100 + id);
        Step(tracker);
    }
    tracker->Retire(3, &address);
    Step(tracker);
    tracker->Retire(1, &address);
    Step(tracker);
    for (unsigned long id = 10; id < 12; ++id) {
        tracker->Insert(id, 0x100 + id);
        Step(tracker);
    }

    if (tracker->GetOccupancy() != 4) {
        CAMSIM_ERROR_PRINTF(
            "TestPendingRequestTracker %s:%d %s overwrote an id\n", __FILE__,
            __LINE__, policy);
        ret = 1;
    }
    const unsigned long ids[] = {0, 2, 10, 11};
    for (int i = 0; i < 4; ++i) {
        if (!tracker->Retire(ids[i], &address) ||
            address != 0x100 + ids[i]) {
            CAMSIM_ERROR_PRINTF(
                "TestPendingRequestTracker %s:%d %s lost %lu\n", __FILE__,
                __LINE__, policy, ids[i]);
            ret = 1;
        }
        Step(tracker);
    }
    if (!tracker->IsEmpty()) {
        CAMSIM_ERROR_PRINTF("TestPendingRequestTracker %s:%d %s not empty\n",
                            __FILE__, __LINE__, policy);
        ret = 1;
    }

    delete tracker;
    return ret;
}

int TestPendingRequestTracker() {
    if (TestTrackerOutOfOrder("plru")) return 1;
    if (TestTrackerOutOfOrder("lru")) return 1;
    if (TestTrackerOutOfOrder("roundrobin")) return 1;
    if (TestTrackerOutOfOrder("available")) return 1;

    if (TestTrackerWithPolicy("plru")) return 1;
    if (TestTrackerWithPolicy("lru")) return 1;
    if (TestTrackerWithPolicy("available")) return 1;

    if (PendingRequestTracker::New(1, "available") != NULL ||
        PendingRequestTracker::New(4, "mru") != NULL) {
        CAMSIM_ERROR_PRINTF("TestPendingRequestTracker %s:%d bad config\n",
                            __FILE__, __LINE__);
        return 1;
    }

    // Round robin doesn't promise to reuse the retired way.
    PendingRequestTracker* tracker =
        PendingRequestTracker::New(2, "roundrobin");
    if (tracker == NULL || tracker->ReusesInvalidatedWay()) {
        CAMSIM_ERROR_PRINTF("TestPendingRequestTracker %s:%d\n", __FILE__,
                            __LINE__);
        delete tracker;
        return 1;
    }
    delete tracker;

    return 0;
}

#endif  // NDEBUG
