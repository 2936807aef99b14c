#ifndef CAMSIM_ENGINE_COMPONENT_HPP_
#define CAMSIM_ENGINE_COMPONENT_HPP_

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
 * @file component.hpp
 * @brief Public API of the component template class.
 */

#include <engine/linkable.hpp>

/**
 * @details All components shall inherit from this class. The MessageType type
 * parameter defines the message type the component receives from other
 * components. If the component does not receive any message, int can be used as
 * a placeholder. Note that Component<T> is just a wrapper for the underlying
 * mother class Linkable. This is done to centralize the message-passing
 * implementation in a non-template class for optimization reasons. This wrapper
 * allows a nice and type-safe API on top of a single, fast and generic
 * implementation.
 *
 * Avoiding big types in MessageType is a good idea, because they're passed by
 * value.
 */
template <typename MessageType>
class Component : public Linkable {
  protected:
    /**
     * @brief Sends a response through one of the connections made to *this*
     * component.
     * @return 0 if successful, 1 otherwise.
     */
    int SendResponseToConnection(int connectionID, MessageType* message) {
        return this->SendResponseUnsafe(connectionID, message);
    };

    /**
     * @brief Takes a request from one of the connections made to *this*
     * component.
     * @return 0 if successful, 1 otherwise.
     */
    int ReceiveRequestFromConnection(int connectionID, MessageType* message) {
        return this->GetRequestUnsafe(connectionID, message);
    };

    /**
     * @brief Looks at the oldest request of a connection, leaving it there.
     * This is the "valid" side of a ready/valid handshake: the request is
     * only taken once the component is ready for it.
     * @return 0 if successful, 1 otherwise.
     */
    int PeekRequestFromConnection(int connectionID, MessageType* message) {
        return this->PeekRequestUnsafe(connectionID, message);
    };

    /** @brief True if a response to the connection would be accepted. */
    bool CanSendResponseToConnection(int connectionID) const {
        return this->CanSendResponseUnsafe(connectionID);
    };

  public:
    inline Component() : Linkable(sizeof(MessageType)) {}

    /**
     * @brief Connects to *this* component.
     * @param bufferSize The size of the buffer to be used. 0 is unbounded.
     * @return The connection ID, or -1 on error.
     */
    int Connect(int bufferSize) { return this->ConnectUnsafe(bufferSize); };

    /**
     * @brief Sends a request to *this* component.
     * @return 0 if successful, 1 if the connection is full.
     */
    int SendRequest(int connectionID, MessageType* message) {
        return this->SendRequestUnsafe(connectionID, message);
    };

    /**
     * @brief Receives a response from *this* component.
     * @return 0 if successful, 1 otherwise.
     */
    int ReceiveResponse(int connectionID, MessageType* message) {
        return this->GetResponseUnsafe(connectionID, message);
    };

    /** @brief True if a request to *this* component would be accepted. */
    bool CanSendRequest(int connectionID) const {
        return this->CanSendRequestUnsafe(connectionID);
    };

    /**
     * @brief Looks at the oldest response from *this* component, leaving it
     * there.
     * @return 0 if successful, 1 otherwise.
     */
    int PeekResponse(int connectionID, MessageType* message) {
        return this->PeekResponseUnsafe(connectionID, message);
    };

    inline virtual ~Component() {}
};

#endif  // CAMSIM_ENGINE_COMPONENT_HPP_
