#ifndef CAMSIM_ENGINE_DEFAULT_PACKETS_HPP_
#define CAMSIM_ENGINE_DEFAULT_PACKETS_HPP_

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
 * @file default_packets.hpp
 * @brief Standard message types.
 */

/**
 * @brief Exchanged by memory components. It's never ambiguous wether this is
 * a request or response, so the same struct serves both.
 *
 * @details A request carries id and address. Its response carries the same
 * id, the data and, when the data must not be kept by caches on the way back,
 * nonCacheable. Responders copy the address into the response too.
 */
struct MemoryPacket {
    unsigned long id;      /** @brief Chosen by the requester. */
    unsigned long address; /** @brief What is being read. */
    unsigned long data;    /** @brief Response only. */
    bool nonCacheable;     /** @brief Response only. */
};

/**
 * @brief The contents of simulated memory: a fixed mix of the address bits.
 * Backing memories answer with it and traffic generators check against it.
 */
static inline unsigned long MemoryDataFor(unsigned long address) {
    unsigned long data = address * 0x9e3779b1UL;
    return data ^ (data >> 15) ^ 0x5bd1e995UL;
}

#endif  // CAMSIM_ENGINE_DEFAULT_PACKETS_HPP_
