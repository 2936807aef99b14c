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
 * @file tests.cpp
 * @details Defines the tests the simulator supports. A test is a function with
 * the signature `int()` that returns 0 if the test succeeds and a number
 * greater than zero otherwise. To add a test to the infrastructure, go to the
 * file `tests.cpp` and declare your test inside the function `Test` with the
 * `TEST()` macro.
 */

#ifndef NDEBUG

#include "tests.hpp"

#include <camsim.hpp>
#include <config/engine_builder.hpp>
#include <std_components/channels/buffered_channel.hpp>
#include <std_components/channels/cached_channel.hpp>
#include <std_components/channels/cached_request_response_channel.hpp>
#include <std_components/channels/response_router.hpp>
#include <std_components/memory/backing_memory.hpp>
#include <std_components/misc/traffic_generator.hpp>
#include <utils/cache/associative_cache.hpp>
#include <utils/cache/pending_request_tracker.hpp>
#include <utils/cache/replacement_policies/available_invalidated.hpp>
#include <utils/cache/replacement_policies/lru.hpp>
#include <utils/cache/replacement_policies/pseudo_lru.hpp>
#include <utils/cache/replacement_policies/random.hpp>
#include <utils/cache/replacement_policies/round_robin.hpp>
#include <utils/cache/replacement_policy.hpp>
#include <utils/circular_buffer.hpp>
#include <utils/map.hpp>
#include <utils/ready_valid_fifo.hpp>
#include <yaml/yaml_parser.hpp>

/**
 * @brief Runs a test by name.
 */
int Test(const char* test) {
    TEST(TestHashMap);
    TEST(TestCircularBuffer);
    TEST(TestYamlParser);
    TEST(TestConfig);

    TEST(TestReplacementPolicyFactory);
    TEST(TestPseudoLRU);
    TEST(TestLRU);
    TEST(TestRoundRobin);
    TEST(TestRandomPolicy);
    TEST(TestAvailableInvalidated);

    TEST(TestAssociativeCacheScenarios);
    TEST(TestAssociativeCacheReadInvalidate);
    TEST(TestAssociativeCacheEmptyWayFirst);
    TEST(TestAssociativeCachePolicyEvents);
    TEST(TestAssociativeCacheInvalidate);
    TEST(TestAssociativeCachePorts);
    TEST(TestAssociativeCacheSets);
    TEST(TestAssociativeCacheReset);
    TEST(TestAssociativeCacheErrors);
    TEST(TestAssociativeCacheFuzz);
    TEST(TestPendingRequestTracker);
    TEST(TestReadyValidFifo);

    TEST(TestCachedChannelMissThenResponse);
    TEST(TestCachedChannelIdInFlight);
    TEST(TestCachedChannelResponseBackpressure);
    TEST(TestCachedChannelTrackerFull);
    TEST(TestCachedChannelOutOfOrderRetire);
    TEST(TestCachedChannelCacheWrite);
    TEST(TestCachedChannelResetCache);
    TEST(TestCachedChannelNonCacheable);
    TEST(TestCachedChannelFuzz);

    TEST(TestResponseRouter);
    TEST(TestCachedChannelComponent);
    TEST(TestCachedChannelConfigErrors);
    TEST(TestBufferedChannel);
    TEST(TestBackingMemory);
    TEST(TestTrafficGenerator);

    TEST(TestEngineBuilder);
    TEST(TestSimulation);

    return -1;
}

#endif  // NDEBUG
