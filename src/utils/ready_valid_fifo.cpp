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
 * @file ready_valid_fifo.cpp
 * @brief Tests of the ReadyValidFifo template.
 */

#include "ready_valid_fifo.hpp"

#ifndef NDEBUG

int TestReadyValidFifo() {
    if (ReadyValidFifo<int>::New(0) != NULL) {
        CAMSIM_ERROR_PRINTF("TestReadyValidFifo %s:%d depth 0 accepted\n",
                            __FILE__, __LINE__);
        return 1;
    }

    ReadyValidFifo<int>* fifo = ReadyValidFifo<int>::New(2);
    int value = 0;

    // A push isn't visible until the step ends.
    if (fifo->Enqueue(1) || fifo->Peek(&value) == 0) {
        CAMSIM_ERROR_PRINTF("TestReadyValidFifo %s:%d\n", __FILE__, __LINE__);
        delete fifo;
        return 1;
    }
    // One push per step.
    if (fifo->CanEnqueue() || fifo->Enqueue(9) == 0) {
        CAMSIM_ERROR_PRINTF("TestReadyValidFifo %s:%d second push\n", __FILE__,
                            __LINE__);
        delete fifo;
        return 1;
    }
    fifo->PosClock();

    fifo->Enqueue(2);
    fifo->PosClock();
    if (!fifo->IsFull() || fifo->CanEnqueue()) {
        CAMSIM_ERROR_PRINTF("TestReadyValidFifo %s:%d should be full\n",
                            __FILE__, __LINE__);
        delete fifo;
        return 1;
    }

    // Taking the head doesn't make room in the same step.
    if (fifo->Dequeue(&value) || value != 1 || fifo->CanEnqueue()) {
        CAMSIM_ERROR_PRINTF("TestReadyValidFifo %s:%d\n", __FILE__, __LINE__);
        delete fifo;
        return 1;
    }
    // One pop per step.
    if (fifo->Dequeue(&value) == 0) {
        CAMSIM_ERROR_PRINTF("TestReadyValidFifo %s:%d second pop\n", __FILE__,
                            __LINE__);
        delete fifo;
        return 1;
    }
    fifo->PosClock();

    // Pop and push in the same step on a queue with room.
    if (fifo->Enqueue(3) || fifo->Dequeue(&value) || value != 2) {
        CAMSIM_ERROR_PRINTF("TestReadyValidFifo %s:%d\n", __FILE__, __LINE__);
        delete fifo;
        return 1;
    }
    fifo->PosClock();
    if (fifo->GetOccupancy() != 1 || fifo->Peek(&value) || value != 3) {
        CAMSIM_ERROR_PRINTF("TestReadyValidFifo %s:%d order lost\n", __FILE__,
                            __LINE__);
        delete fifo;
        return 1;
    }

    fifo->Flush();
    if (!fifo->IsEmpty() || fifo->Dequeue(&value) == 0) {
        CAMSIM_ERROR_PRINTF("TestReadyValidFifo %s:%d flush\n", __FILE__,
                            __LINE__);
        delete fifo;
        return 1;
    }

    delete fifo;
    return 0;
}

#endif  // NDEBUG
