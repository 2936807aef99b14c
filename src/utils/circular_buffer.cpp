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
 * @file circular_buffer.cpp
 * @brief Implementation of the CircularBuffer class.
 */

#include "circular_buffer.hpp"

#include <cstdlib>
#include <utils/logging.hpp>

const int defaultBufferSize = 8;

int CircularBuffer::Allocate(int bufferSize, int elementSize) {
    if (elementSize <= 0 || bufferSize < 0) return 1;

    this->Deallocate();

    this->occupation = 0;
    this->startOfBuffer = 0;
    this->endOfBuffer = 0;
    this->elementSize = elementSize;
    this->maxBufferSize = bufferSize;
    this->bufferSize = bufferSize == 0 ? defaultBufferSize : bufferSize;

    this->buffer = malloc(this->bufferSize * elementSize);
    if (this->buffer == NULL) {
        CAMSIM_ERROR_PRINTF("Failed to allocate a circular buffer of %d.\n",
                            this->bufferSize);
        return 1;
    }

    return 0;
}

void CircularBuffer::Deallocate() {
    if (this->buffer) {
        free(this->buffer);
        this->buffer = NULL;
    }
}

int CircularBuffer::Grow() {
    char* newBuffer = (char*)malloc(this->bufferSize * 2 * this->elementSize);
    if (newBuffer == NULL) return 1;

    // The buffer is full here, so the elements start at startOfBuffer and wrap
    // around to it.
    const long head =
        (long)(this->bufferSize - this->startOfBuffer) * this->elementSize;
    memcpy(newBuffer,
           (char*)this->buffer + this->startOfBuffer * this->elementSize,
           head);
    memcpy(newBuffer + head, this->buffer,
           (long)this->startOfBuffer * this->elementSize);

    free(this->buffer);
    this->buffer = newBuffer;
    this->startOfBuffer = 0;
    this->endOfBuffer = this->bufferSize;
    this->bufferSize *= 2;

    return 0;
}

bool CircularBuffer::Enqueue(const void* elementInput) {
    if (this->buffer == NULL) return 1;

    if (this->occupation == this->bufferSize) {
        if (this->maxBufferSize != 0) return 1;
        if (this->Grow()) return 1;
    }

    void* memoryAddress = static_cast<char*>(this->buffer) +
                          (this->endOfBuffer * this->elementSize);

    memcpy(memoryAddress, elementInput, this->elementSize);
    ++this->occupation;
    ++this->endOfBuffer;

    if (this->endOfBuffer == this->bufferSize) {
        this->endOfBuffer = 0;
    }

    return 0;
}

bool CircularBuffer::Dequeue(void* elementOutput) {
    if (this->Peek(elementOutput)) return 1;

    --this->occupation;
    ++this->startOfBuffer;

    if (this->startOfBuffer == this->bufferSize) {
        this->startOfBuffer = 0;
    }

    return 0;
}

bool CircularBuffer::Peek(void* elementOutput) const {
    if (this->IsEmpty()) return 1;

    const void* memoryAddress = static_cast<char*>(this->buffer) +
                                (this->startOfBuffer * this->elementSize);
    memcpy(elementOutput, memoryAddress, this->elementSize);

    return 0;
}

void CircularBuffer::Flush() {
    this->occupation = 0;
    this->startOfBuffer = 0;
    this->endOfBuffer = 0;
}

#ifndef NDEBUG

int TestCircularBuffer() {
    CircularBuffer bounded;
    if (bounded.Allocate(3, sizeof(long))) return 1;

    long in = 10;
    for (int i = 0; i < 3; ++i) {
        in = 10 + i;
        if (bounded.Enqueue(&in)) {
            CAMSIM_ERROR_PRINTF("TestCircularBuffer %s:%d enqueue %d failed\n",
                                __FILE__, __LINE__, i);
            return 1;
        }
    }
    if (!bounded.IsFull() || bounded.Enqueue(&in) == 0) {
        CAMSIM_ERROR_PRINTF("TestCircularBuffer %s:%d bound not enforced\n",
                            __FILE__, __LINE__);
        return 1;
    }

    long out;
    bounded.Peek(&out);
    if (out != 10 || bounded.GetOccupation() != 3) {
        CAMSIM_ERROR_PRINTF("TestCircularBuffer %s:%d peek got %ld\n",
                            __FILE__, __LINE__, out);
        return 1;
    }

    // Wrap around.
    bounded.Dequeue(&out);
    in = 13;
    bounded.Enqueue(&in);
    for (long expected = 11; expected <= 13; ++expected) {
        if (bounded.Dequeue(&out) || out != expected) {
            CAMSIM_ERROR_PRINTF("TestCircularBuffer %s:%d expected %ld got %ld\n",
                                __FILE__, __LINE__, expected, out);
            return 1;
        }
    }
    if (bounded.Dequeue(&out) == 0) {
        CAMSIM_ERROR_PRINTF("TestCircularBuffer %s:%d dequeued from empty\n",
                            __FILE__, __LINE__);
        return 1;
    }

    // Growable buffer, forced to grow while wrapped.
    CircularBuffer growable;
    growable.Allocate(0, sizeof(long));
    for (in = 0; in < 5; ++in) growable.Enqueue(&in);
    for (int i = 0; i < 5; ++i) growable.Dequeue(&out);
    for (in = 100; in < 120; ++in) growable.Enqueue(&in);
    for (long expected = 100; expected < 120; ++expected) {
        if (growable.Dequeue(&out) || out != expected) {
            CAMSIM_ERROR_PRINTF("TestCircularBuffer %s:%d expected %ld got %ld\n",
                                __FILE__, __LINE__, expected, out);
            return 1;
        }
    }

    return 0;
}

#endif  // NDEBUG
