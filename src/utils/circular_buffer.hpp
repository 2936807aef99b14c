#ifndef CAMSIM_UTILS_CIRCULAR_BUFFER_HPP_
#define CAMSIM_UTILS_CIRCULAR_BUFFER_HPP_

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
 * @file circular_buffer.hpp
 * @brief Circular Buffer Class.
 * @details Untyped ring of fixed-size elements. The connections between
 * components and the response buffer of the channels are built on it.
 */

#include <cstring>

/**
 * @brief A performant circular buffer.
 * @details You may use this as a queue. Use Allocate() to init it.
 */
class CircularBuffer {
  private:
    void* buffer;      /**<The Buffer. */
    int occupation;    /**<Buffer's current occupancy */
    int maxBufferSize; /**<The maximum buffer capacity. Zero if it can grow
                       undefinitely. */
    int bufferSize;    /**<Actual alloced buffer size. */
    int elementSize;   /**<The element size supported by the buffer. */
    int startOfBuffer; /**<Index of the oldest element. */
    int endOfBuffer;   /**<Index where the next element goes. */

    /** @brief Doubles the storage, keeping the elements in order. */
    int Grow();

  public:
    CircularBuffer()
        : buffer(NULL),
          occupation(0),
          maxBufferSize(0),
          bufferSize(0),
          elementSize(0),
          startOfBuffer(0),
          endOfBuffer(0) {};

    inline bool IsAllocated() const { return this->buffer != NULL; };
    inline int GetSize() const { return this->bufferSize; };
    inline int GetOccupation() const { return this->occupation; };
    inline bool IsEmpty() const { return this->occupation == 0; };

    /**
     * @brief Full means the next Enqueue() fails. A growable buffer is never
     * full.
     */
    inline bool IsFull() const {
        return this->maxBufferSize != 0 &&
               this->occupation == this->maxBufferSize;
    };

    /**
     * @brief Allocates the structure of a Circular Buffer.
     * @param bufferSize When > 0, sets a limit size, and trying to enqueue more
     * elements will result in an error. When 0, the buffer grows as needed.
     * @param elementSize Size in bytes of each element.
     * @return 0 if successfuly, 1 otherwise.
     */
    int Allocate(int bufferSize, int elementSize);

    /**
     * @brief Deallocates the Circular Buffer. Also called by the destructor.
     */
    void Deallocate();

    /**
     * @brief Inserts the element at the "top" of the buffer.
     * @param elementInput A pointer to the element to be inserted.
     * @return 0 if successfuly, 1 otherwise.
     */
    bool Enqueue(const void* elementInput);

    /**
     * @brief Removes and returns the element contained in the "base" of the
     * Buffer.
     * @param elementOutput Where the element is copied to.
     * @return 0 if successfuly, 1 otherwise.
     */
    bool Dequeue(void* elementOutput);

    /**
     * @brief Copies the element at the "base" of the buffer without removing
     * it.
     * @return 0 if successfuly, 1 if the buffer is empty.
     */
    bool Peek(void* elementOutput) const;

    /**
     * @brief Drops every element.
     */
    void Flush();

    ~CircularBuffer() { this->Deallocate(); };
};

#ifndef NDEBUG
int TestCircularBuffer();
#endif

#endif  // CAMSIM_UTILS_CIRCULAR_BUFFER_HPP_
