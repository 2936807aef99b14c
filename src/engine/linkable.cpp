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
 * @file linkable.cpp
 * @brief Implementation of the Linkable class.
 */

#include "linkable.hpp"

#include <cstdlib>
#include <utils/logging.hpp>

int Connection::CreateBuffers(int bufferSize, int messageSize) {
    this->bufferSize = bufferSize;
    this->messageSize = messageSize;

    // Staging and visible buffers never hold more than bufferSize together,
    // so each one alone can be bounded by it.
    for (int i = 0; i < 2; ++i) {
        if (this->requestBuffers[i].Allocate(bufferSize, messageSize))
            return 1;
        if (this->responseBuffers[i].Allocate(bufferSize, messageSize))
            return 1;
    }

    return 0;
}

void Connection::Drain(CircularBuffer* from, CircularBuffer* to,
                       int messageSize) {
    if (from->IsEmpty()) return;

    void* message = malloc(messageSize);
    while (from->Dequeue(message) == 0) {
        to->Enqueue(message);
    }
    free(message);
}

void Connection::CommitBuffers() {
    Drain(&this->requestBuffers[SOURCE_ID], &this->requestBuffers[DEST_ID],
          this->messageSize);
    Drain(&this->responseBuffers[DEST_ID], &this->responseBuffers[SOURCE_ID],
          this->messageSize);
}

bool Connection::InsertIntoRequestBuffer(void* messageInput) {
    if (!this->HasRoom(this->requestBuffers)) return 1;
    return this->requestBuffers[SOURCE_ID].Enqueue(messageInput);
}

bool Connection::InsertIntoResponseBuffer(void* messageInput) {
    if (!this->HasRoom(this->responseBuffers)) return 1;
    return this->responseBuffers[DEST_ID].Enqueue(messageInput);
}

bool Connection::RemoveFromRequestBuffer(void* messageOutput) {
    return this->requestBuffers[DEST_ID].Dequeue(messageOutput);
}

bool Connection::RemoveFromResponseBuffer(void* messageOutput) {
    return this->responseBuffers[SOURCE_ID].Dequeue(messageOutput);
}

bool Connection::PeekRequestBuffer(void* messageOutput) const {
    return this->requestBuffers[DEST_ID].Peek(messageOutput);
}

bool Connection::PeekResponseBuffer(void* messageOutput) const {
    return this->responseBuffers[SOURCE_ID].Peek(messageOutput);
}

bool Connection::HasMessages() const {
    for (int i = 0; i < 2; ++i) {
        if (!this->requestBuffers[i].IsEmpty()) return true;
        if (!this->responseBuffers[i].IsEmpty()) return true;
    }
    return false;
}

Linkable::Linkable(int messageSize) : messageSize(messageSize) {}

long Linkable::GetNumberOfConnections() const {
    return this->connections.size();
}

void Linkable::PosClock() {
    for (unsigned int i = 0; i < this->connections.size(); ++i) {
        this->connections[i]->CommitBuffers();
    }
}

bool Linkable::HasPendingMessages() const {
    for (unsigned int i = 0; i < this->connections.size(); ++i) {
        if (this->connections[i]->HasMessages()) return true;
    }
    return false;
}

int Linkable::ConnectUnsafe(int bufferSize) {
    Connection* newConnection = new Connection();
    if (newConnection->CreateBuffers(bufferSize, this->messageSize)) {
        CAMSIM_ERROR_PRINTF("Failed to create a connection of size %d.\n",
                            bufferSize);
        delete newConnection;
        return -1;
    }

    this->connections.push_back(newConnection);
    return this->connections.size() - 1;
}

int Linkable::SendRequestUnsafe(int connectionID, void* messageInput) {
    return this->connections[connectionID]->InsertIntoRequestBuffer(
        messageInput);
}

int Linkable::GetRequestUnsafe(int connectionID, void* messageOutput) {
    return this->connections[connectionID]->RemoveFromRequestBuffer(
        messageOutput);
}

int Linkable::PeekRequestUnsafe(int connectionID, void* messageOutput) {
    return this->connections[connectionID]->PeekRequestBuffer(messageOutput);
}

int Linkable::PeekResponseUnsafe(int connectionID, void* messageOutput) {
    return this->connections[connectionID]->PeekResponseBuffer(messageOutput);
}

bool Linkable::CanSendRequestUnsafe(int connectionID) const {
    return this->connections[connectionID]->CanInsertIntoRequestBuffer();
}

bool Linkable::CanSendResponseUnsafe(int connectionID) const {
    return this->connections[connectionID]->CanInsertIntoResponseBuffer();
}

int Linkable::SendResponseUnsafe(int connectionID, void* messageInput) {
    return this->connections[connectionID]->InsertIntoResponseBuffer(
        messageInput);
}

int Linkable::GetResponseUnsafe(int connectionID, void* messageOutput) {
    return this->connections[connectionID]->RemoveFromResponseBuffer(
        messageOutput);
}

Linkable::~Linkable() {
    for (unsigned int i = 0; i < this->connections.size(); ++i) {
        delete this->connections[i];
    }
}
