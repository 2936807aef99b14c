#ifndef CAMSIM_UTILS_READY_VALID_FIFO_HPP_
#define CAMSIM_UTILS_READY_VALID_FIFO_HPP_

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
 * @file ready_valid_fifo.hpp
 * @brief Bounded FIFO with one push and one pop per step.
 */

#include <utils/circular_buffer.hpp>
#include <utils/logging.hpp>

/**
 * @details CanEnqueue() and Peek() look at the queue as it was when the step
 * began. Enqueue() and Dequeue() are only staged, and PosClock() applies the
 * pop and then the push. A full queue stays full for the whole step even if
 * its head is taken in that step.
 */
template <typename Type>
class ReadyValidFifo {
  private:
    CircularBuffer buffer;
    int depth;
    bool pushStaged;
    bool popStaged;
    Type staged;

    ReadyValidFifo() : depth(0), pushStaged(false), popStaged(false) {}

  public:
    /**
     * @param depth At least 1.
     * @returns NULL on error, after printing it.
     */
    static ReadyValidFifo* New(int depth) {
        if (depth < 1) {
            CAMSIM_ERROR_PRINTF("ReadyValidFifo: depth must be at least 1.\n");
            return NULL;
        }
        ReadyValidFifo* fifo = new ReadyValidFifo();
        if (fifo->buffer.Allocate(depth, sizeof(Type))) {
            delete fifo;
            return NULL;
        }
        fifo->depth = depth;
        return fifo;
    }

    /** @brief The "ready" side of the producer handshake. */
    inline bool CanEnqueue() const {
        return !this->pushStaged && this->buffer.GetOccupation() < this->depth;
    }

    /** @return 0 if successfuly, 1 if there's no room this step. */
    bool Enqueue(const Type& element) {
        if (!this->CanEnqueue()) return 1;
        this->staged = element;
        this->pushStaged = true;
        return 0;
    }

    /** @return 0 if successfuly, 1 if empty at the start of the step. */
    bool Peek(Type* element) const {
        if (this->popStaged) return 1;
        return this->buffer.Peek(element);
    }

    /** @return 0 if successfuly, 1 if there's nothing to take this step. */
    bool Dequeue(Type* element) {
        if (this->Peek(element)) return 1;
        this->popStaged = true;
        return 0;
    }

    void PosClock() {
        if (this->popStaged) {
            Type discarded;
            this->buffer.Dequeue(&discarded);
            this->popStaged = false;
        }
        if (this->pushStaged) {
            this->buffer.Enqueue(&this->staged);
            this->pushStaged = false;
        }
    }

    /** @brief Drops everything, staged operations included. */
    void Flush() {
        this->buffer.Flush();
        this->pushStaged = false;
        this->popStaged = false;
    }

    inline int GetOccupancy() const { return this->buffer.GetOccupation(); }
    inline int GetDepth() const { return this->depth; }
    inline bool IsEmpty() const { return this->buffer.IsEmpty(); }
    inline bool IsFull() const {
        return this->buffer.GetOccupation() == this->depth;
    }
};

#ifndef NDEBUG
int TestReadyValidFifo();
#endif

#endif  // CAMSIM_UTILS_READY_VALID_FIFO_HPP_
