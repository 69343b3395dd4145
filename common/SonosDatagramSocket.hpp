// Copyright (c) 2015-2020 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SonosDiscoveryConfig.hpp"
#include <cstddef>
#include <string>
#include <mutex>

/*!
 * Create one instance of the session per process to use sockets.
 */
class SONOS_DISCOVERY_API SonosSocketSession
{
public:
    SonosSocketSession(void);
    ~SonosSocketSession(void);
};

/*!
 * A simple UDP socket wrapper for multicast search and unicast replies.
 * Calls report failure through the return code and lastErrorMsg().
 * Send, receive and select may be called from different threads.
 */
class SONOS_DISCOVERY_API SonosDatagramSocket
{
public:
    //! Create a null socket
    SonosDatagramSocket(void);

    ~SonosDatagramSocket(void);

    /*!
     * Is the socket null?
     * The default constructor makes a null socket.
     * The socket is non null after multicastSender or bind.
     */
    bool null(void) const;

    /*!
     * Explicit close the socket, also done by destructor.
     * Closing a null socket is a no-op that returns 0.
     */
    int close(void);

    /*!
     * Make the socket for sending to a multi-cast group.
     * The socket is not bound, the first send picks an ephemeral port.
     * \param group the url for the multicast group and port number
     * \param ttl specify time to live for send packets
     * \param loop specify to receive local loopback
     */
    int multicastSender(const std::string &group, const int ttl, const bool loop = true);

    /*!
     * Bind to a local address.
     * URL examples:
     * 0.0.0.0:1900
     * 127.0.0.2:0
     */
    int bind(const std::string &url);

    /*!
     * Send to a specific destination.
     * Return bytes sent or negative error.
     */
    int sendto(const void *buf, size_t len, const std::string &url);

    /*!
     * Receive from an unconnected socket.
     * Blocks until a datagram arrives.
     * Return bytes received or negative error.
     */
    int recvfrom(void *buf, size_t len, std::string &url);

    /*!
     * Wait for recv to become ready with timeout.
     * Return 1 for ready, 0 for timeout or interrupt, -1 for error.
     */
    int selectRecv(const long timeoutUs);

    /*!
     * Get the time to live for multicast sends.
     * Return the hop count or negative error.
     */
    int getMulticastTTL(void);

    /*!
     * Query the last error message as a string.
     */
    std::string lastErrorMsg(void) const;

    /*!
     * Get the URL of the local socket.
     * Return an empty string on error.
     */
    std::string getsockname(void);

private:
    //non-copyable
    SonosDatagramSocket(const SonosDatagramSocket &);
    SonosDatagramSocket &operator=(const SonosDatagramSocket &);

    int _sock;
    mutable std::mutex _errorMutex;
    std::string _lastErrorMsg;

    void reportError(const std::string &what, const std::string &errorMsg);
    void reportError(const std::string &what, const int err);
    void reportError(const std::string &what);
};
