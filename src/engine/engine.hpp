#ifndef CAMSIM_ENGINE_HPP_
#define CAMSIM_ENGINE_HPP_

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
 * @file engine.hpp
 * @brief Public API of the simulation engine.
 */

#include <ctime>
#include <engine/linkable.hpp>
#include <vector>

/**
 * @brief The engine itself.
 * @details Each cycle the engine calls Clock() on every component and then
 * PosClock() on every component. It keeps cycling while any component is
 * busy.
 */
class Engine {
  private:
    std::vector<Linkable*> components; /** @brief Owned by the engine. */
    unsigned long totalCycles;         /** @brief Counter of cycles. */

    /** @brief Prints how far the simulation went. */
    void PrintTime(time_t start, unsigned long cycle);

    bool IsBusy();

  public:
    inline Engine() : totalCycles(0) {}

    /**
     * @brief Instantiates a simulation from the components. The engine owns
     * them from now on.
     */
    inline void Instantiate(const std::vector<Linkable*>& components) {
        this->components = components;
    }

    /**
     * @brief Self-explanatory.
     * @param maxCycles The simulation is stopped there if components are
     * still busy.
     * @returns Non-zero if the simulation stopped because of a problem. 0 if it
     * stopped normally.
     */
    int Simulate(unsigned long maxCycles);

    inline unsigned long GetTotalCycles() const { return this->totalCycles; }
    inline long GetNumberOfComponents() const {
        return this->components.size();
    }
    inline Linkable* GetComponent(long i) const { return this->components[i]; }

    ~Engine();
};

#endif  // CAMSIM_ENGINE_HPP_
