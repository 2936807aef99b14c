#ifndef CAMSIM_ARENA_HPP_
#define CAMSIM_ARENA_HPP_

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
 * @file arena.hpp
 * @brief Public API and inline implementation of a growable arena. Everything
 * the configuration parser produces lives in one, and dies with it.
 */

#include <cstdlib>

class Arena {
  private:
    unsigned long top;
    unsigned long size;
    unsigned char* mem;
    Arena* next;

    static inline unsigned long Align(unsigned long size) {
        const unsigned long rest = size % sizeof(void*);
        return rest == 0 ? size : size + (sizeof(void*) - rest);
    }

    // Not copyable: the memory belongs to exactly one arena.
    Arena(const Arena&);
    Arena& operator=(const Arena&);

  public:
    inline Arena(unsigned long size)
        : top(0),
          size(Align(size)),
          mem(new unsigned char[Align(size)]),
          next(NULL) {}

    /** @brief Pointer-aligned memory, valid until the arena is deleted. */
    inline void* Alloc(unsigned long size) {
        size = Align(size);
        if (this->top + size > this->size) {
            if (this->next == NULL) {
                this->next = new Arena(this->size > size ? this->size : size);
            }
            return this->next->Alloc(size);
        }

        void* const ptr = (void*)&this->mem[top];
        this->top += size;
        return ptr;
    }

    inline ~Arena() {
        delete[] this->mem;
        if (this->next != NULL) {
            delete this->next;
        }
    }
};

#endif  // CAMSIM_ARENA_HPP_
