#ifndef CAMSIM_STD_COMPONENTS_MISC_TRAFFIC_GENERATOR_HPP_
#define CAMSIM_STD_COMPONENTS_MISC_TRAFFIC_GENERATOR_HPP_

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
 * @file traffic_generator.hpp
 * @brief Issues read requests and checks what comes back.
 * @details The generator sends `requests` requests to `sendTo`, at most
 * one per cycle. Ids are taken from [0, `ids`) and an id is never reused
 * while its response is missing. Addresses fall in [`base`, `base` +
 * `range`): `pattern: sequential` walks them by `stride`, `pattern:
 * random` draws them from a generator seeded with `seed`.
 *
 * Every response must match an outstanding id, come back with the address
 * it was sent with and carry MemoryDataFor(address). Anything else is
 * reported as an error and counted.
 */

#include <camsim.hpp>
#include <random>

class TrafficGenerator : public Component<MemoryPacket> {
  private:
    Component<MemoryPacket>* sendTo;
    int sendToId;

    unsigned long requests;
    unsigned long ids;
    unsigned long base;
    unsigned long range;
    unsigned long stride;
    bool randomPattern;
    std::minstd_rand generator;

    bool* outstanding;
    unsigned long* sentAddress;
    unsigned long* sentAt;
    unsigned long nextId;
    unsigned long nextAddress;
    unsigned long cycle;

    unsigned long issued;
    unsigned long completed;
    unsigned long inFlight;
    unsigned long errors;
    unsigned long totalLatency;
    unsigned long statNoFreeId;
    unsigned long statBackpressure;

    void PrepareNextAddress();
    void Issue();
    void Check(const MemoryPacket* response);

  public:
    TrafficGenerator();

    inline unsigned long GetCompleted() const { return this->completed; }
    inline unsigned long GetErrors() const { return this->errors; }

    virtual int Configure(Config config);
    virtual void Clock();
    virtual bool IsBusy();
    virtual void PrintStatistics();
    virtual ~TrafficGenerator();
};

#ifndef NDEBUG
int TestTrafficGenerator();
#endif

#endif  // CAMSIM_STD_COMPONENTS_MISC_TRAFFIC_GENERATOR_HPP_
