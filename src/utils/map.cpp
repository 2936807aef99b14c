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
 * @file map.cpp
 * @details Implementation of the map.
 */

#include <cstring>
#include <utils/logging.hpp>
#include <utils/map.hpp>

unsigned int map::Hash(const unsigned char* const buffer, unsigned long size) {
    if (size <= 0) return 0;

    unsigned int s = buffer[0];
    unsigned int p = map::P;

    for (unsigned long i = 1; i < size; ++i) {
        s += buffer[i] * p;
        p *= map::P;
    }

    return s % map::M;
}

#ifndef NDEBUG

int TestHashMap() {
    Map<unsigned int> intMap;

    intMap.Insert("foo", 0xcafebabe);
    intMap.Insert("bar", 0xb15b00b5);

    if (*intMap.Get("foo") != 0xcafebabe) {
        CAMSIM_ERROR_PRINTF("HashMap test failed at %s:%u\n", __FILE__,
                            __LINE__);
        return 1;
    }
    if (*intMap.Get("bar") != 0xb15b00b5) {
        CAMSIM_ERROR_PRINTF("HashMap test failed at %s:%u\n", __FILE__,
                            __LINE__);
        return 1;
    }
    if (intMap.Get("baz") != NULL) {
        CAMSIM_ERROR_PRINTF("HashMap test failed at %s:%u\n", __FILE__,
                            __LINE__);
        return 1;
    }

    intMap.Insert("foo", 7);
    if (*intMap.Get("foo") != 7) {
        CAMSIM_ERROR_PRINTF("HashMap test failed at %s:%u\n", __FILE__,
                            __LINE__);
        return 1;
    }

    // A borrowed arena, and enough keys to chain inside buckets.
    Arena arena(64);
    Map<long> longMap(&arena);
    char key[16];
    for (long i = 0; i < 2000; ++i) {
        snprintf(key, sizeof(key), "key%ld", i);
        longMap.Insert(key, i);
    }

    long sum = 0;
    long count = 0;
    long value;
    longMap.ResetIterator();
    for (const char* k = longMap.Next(&value); k != NULL;
         k = longMap.Next(&value)) {
        if (*longMap.Get(k) != value) {
            CAMSIM_ERROR_PRINTF("HashMap test failed at %s:%u key %s\n",
                                __FILE__, __LINE__, k);
            return 1;
        }
        sum += value;
        ++count;
    }
    if (count != 2000 || sum != 1999 * 2000 / 2) {
        CAMSIM_ERROR_PRINTF("HashMap test iterated %ld elements, sum %ld\n",
                            count, sum);
        return 1;
    }

    return 0;
}

#endif  // NDEBUG
