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
 * @file engine.cpp
 * @brief Implementation of the simulation engine.
 */

#include "engine.hpp"

#include <cstdio>
#include <ctime>
#include <utils/logging.hpp>

/** @brief Cycles between heartbeats. */
const unsigned long HEARTBEAT = 1 << 16;

void Engine::PrintTime(time_t start, unsigned long cycle) {
    const time_t now = time(NULL);
    CAMSIM_LOG_PRINTF("engine: Heartbeat at cycle %lu, %ld seconds in.\n",
                      cycle, (long)(now - start));
}

bool Engine::IsBusy() {
    for (unsigned long i = 0; i < this->components.size(); ++i) {
        if (this->components[i]->IsBusy()) return true;
    }
    return false;
}

int Engine::Simulate(unsigned long maxCycles) {
    const time_t start = time(NULL);
    bool limitReached = false;

    CAMSIM_LOG_PRINTF("engine: Simulation started at %s", ctime(&start));
    CAMSIM_LOG_PRINTF("engine: %lu components.\n",
                      (unsigned long)this->components.size());

    while (this->IsBusy()) {
        if (this->totalCycles == maxCycles) {
            limitReached = true;
            break;
        }

        if ((this->totalCycles + 1) % HEARTBEAT == 0)
            this->PrintTime(start, this->totalCycles + 1);

        for (unsigned long i = 0; i < this->components.size(); ++i)
            this->components[i]->Clock();

        for (unsigned long i = 0; i < this->components.size(); ++i)
            this->components[i]->PosClock();

        ++this->totalCycles;
    }

    const time_t end = time(NULL);
    CAMSIM_LOG_PRINTF("engine: Simulation ended at %s", ctime(&end));
    if (limitReached) {
        CAMSIM_WARNING_PRINTF(
            "engine: Stopped at the limit of %lu cycles with components still "
            "busy.\n",
            maxCycles);
    }

    CAMSIM_LOG_PRINTF("=== SIMULATION STATISTICS ===\n");
    CAMSIM_LOG_PRINTF("engine: Cycled %lu times.\n", this->totalCycles);
    for (unsigned long i = 0; i < this->components.size(); ++i) {
        this->components[i]->PrintStatistics();
    }

    return limitReached;
}

Engine::~Engine() {
    for (unsigned long i = 0; i < this->components.size(); ++i) {
        delete this->components[i];
    }
}
