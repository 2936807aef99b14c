#ifndef CAMSIM_ENGINE_LINKABLE_HPP_
#define CAMSIM_ENGINE_LINKABLE_HPP_

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
 * @file linkable.hpp
 * @brief Public API of the Linkable class.
 */

#include <utils/circular_buffer.hpp>
#include <vector>

class Config;

static const int SOURCE_ID = 0;
static const int DEST_ID = 1;

/**
 * @brief A link between two components.
 * @details Each direction has two buffers. The sender writes into a staging
 * buffer, the receiver reads from a visible one, and CommitBuffers() moves
 * the staged messages to the visible side at the end of the cycle. So a
 * message sent in cycle t is seen in cycle t + 1, and a message the receiver
 * doesn't take stays queued. The buffer size bounds staged plus visible
 * messages, which is what gives the receiver backpressure over the sender.
 */
struct Connection {
  private:
    int bufferSize;
    int messageSize;
    CircularBuffer requestBuffers[2];  /**<Indexed by SOURCE_ID (staging) and
                                          DEST_ID (visible to the receiver).*/
    CircularBuffer responseBuffers[2]; /**<Indexed by DEST_ID (staging) and
                                          SOURCE_ID (visible to the
                                          requester).*/

    static void Drain(CircularBuffer* from, CircularBuffer* to,
                      int messageSize);
    inline bool HasRoom(const CircularBuffer* buffers) const {
        return this->bufferSize == 0 ||
               buffers[0].GetOccupation() + buffers[1].GetOccupation() <
                   this->bufferSize;
    }

  public:
    Connection() : bufferSize(0), messageSize(0) {};

    /**
     * @brief Allocate the buffers used to channels
     * @param bufferSize Zero means unbounded.
     * @param messageSize self-explanatory.
     * @return 0 if successfuly, 1 otherwise.
     */
    int CreateBuffers(int bufferSize, int messageSize);

    inline int GetBufferSize() const { return this->bufferSize; }
    inline int GetMessageSize() const { return this->messageSize; }

    /**
     * @brief Publishes everything staged during the cycle.
     */
    void CommitBuffers();

    /** @return 0 if successfuly, 1 if the connection is full. */
    bool InsertIntoRequestBuffer(void* messageInput);
    /** @return 0 if successfuly, 1 if the connection is full. */
    bool InsertIntoResponseBuffer(void* messageInput);
    /** @return 0 if successfuly, 1 if there's nothing visible. */
    bool RemoveFromRequestBuffer(void* messageOutput);
    /** @return 0 if successfuly, 1 if there's nothing visible. */
    bool RemoveFromResponseBuffer(void* messageOutput);
    /** @return 0 if successfuly, 1 if there's nothing visible. */
    bool PeekRequestBuffer(void* messageOutput) const;
    /** @return 0 if successfuly, 1 if there's nothing visible. */
    bool PeekResponseBuffer(void* messageOutput) const;

    inline bool CanInsertIntoRequestBuffer() const {
        return this->HasRoom(this->requestBuffers);
    }
    inline bool CanInsertIntoResponseBuffer() const {
        return this->HasRoom(this->responseBuffers);
    }

    /** @brief True while any message is staged or visible. */
    bool HasMessages() const;
};

/**
 * @brief Do not inherit directly from this class.
 * @details This class implements the message-passing of the components in a
 * fast and generic manner, without using templates. For this reason, it's not
 * type-safe, but serves as a generic pointer for any component type. Pointers
 * to Linkable should be avoided, and only used when it's not certain and does
 * not matter which type of message the component receives. It's not possible to
 * send a message directly to a Linkable. The Component<T> wrapper methods
 * should be used.
 */
class Linkable {
  private:
    long messageSize;
    std::vector<Connection*> connections; /**< Connections other components
                                             made to *this* one.*/

  protected:
    /**
     * @brief Connect to *this* component.
     * @param bufferSize The size of the buffer used in the connection.
     * @details Method used by other components to connect to *this* component,
     * establishing a connection where *this* component is the one that responds
     * to received messages.
     * @return Returns the id of connection on the receiving component, or -1.
     */
    int ConnectUnsafe(int bufferSize);

    /**
     * @brief Receive a request from other component. (The other calls this
     * method)
     * @return 0 if successfuly, 1 otherwise.
     */
    int SendRequestUnsafe(int connectionID, void* messageInput);

    /**
     * @brief Takes the oldest visible request of a connection.
     * @return 0 if successfuly, 1 otherwise.
     */
    int GetRequestUnsafe(int connectionID, void* messageOutput);

    /**
     * @brief Looks at the oldest visible request without taking it.
     * @return 0 if successfuly, 1 otherwise.
     */
    int PeekRequestUnsafe(int connectionID, void* messageOutput);

    /**
     * @brief Looks at the oldest visible response without taking it.
     * @return 0 if successfuly, 1 otherwise.
     */
    int PeekResponseUnsafe(int connectionID, void* messageOutput);

    /** @brief The "ready" side of a request handshake. */
    bool CanSendRequestUnsafe(int connectionID) const;
    /** @brief The "ready" side of a response handshake. */
    bool CanSendResponseUnsafe(int connectionID) const;

    /**
     * @brief Sends a reply to the connection.
     * @return 0 if successfuly, 1 otherwise.
     */
    int SendResponseUnsafe(int connectionID, void* messageInput);

    /**
     * @brief Gets a response message in the parameter. (The other calls this
     * method)
     * @return 0 if successfuly, 1 otherwise.
     */
    int GetResponseUnsafe(int connectionID, void* messageOutput);

    /** @brief True while any connection still holds messages. */
    bool HasPendingMessages() const;

  public:
    Linkable(int messageSize);

    long GetNumberOfConnections() const;

    /**
     * @brief Don't call this method.
     * @details The engine calls this method after each clock cycle to publish
     * the connection buffers. Components with staged state of their own
     * override it and call this one too.
     */
    virtual void PosClock();

    /**
     * @details Called once by the engine builder with the component's
     * parameters. Non-zero should be returned if any problem occurred (e.g., a
     * required configuration parameter was not provided). The component is
     * responsible for printing a proper error message describing what
     * happened.
     * @returns Non-zero on error, 0 otherwise.
     */
    virtual int Configure(Config config) = 0;

    /**
     * @brief This method should be declared here so the simulator can send
     * clock cycles.
     */
    virtual void Clock() = 0;

    /**
     * @brief The engine keeps cycling while any component is busy.
     */
    virtual bool IsBusy() { return this->HasPendingMessages(); }

    /**
     * @brief This method is called by the engine after the simulation stops, so
     * each component can print it's statistics.
     */
    virtual void PrintStatistics() = 0;

    virtual ~Linkable();
};

#endif  // CAMSIM_ENGINE_LINKABLE_HPP_
