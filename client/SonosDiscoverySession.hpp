// Copyright (c) 2015-2020 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SonosDiscoveryDefs.hpp"
#include "SonosDatagramSocket.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <set>

class SonosReplyCollector;

/*!
 * Discover Sonos zone players on the local network with SSDP.
 *
 * The session sends an M-SEARCH request to the multicast group
 * and collects the addresses of all hosts whose reply mentions Sonos.
 * A session is used from one thread at a time.
 */
class SONOS_DISCOVERY_API SonosDiscoverySession
{
public:

    //! Session lifecycle, any state can move to CLOSED
    enum State
    {
        CONSTRUCTED,
        SEARCH_SENT,
        COLLECTING,
        COMPLETED,
        CLOSED,
    };

    /*!
     * Create the session and its multicast socket.
     * \throws SonosDiscoveryError INVALID_ADDRESS when groupURL is not an IPv4 address and port
     * \throws SonosDiscoveryError SOCKET_CREATION_FAILED when the socket cannot be made
     * \param groupURL the multicast group and port to search
     */
    SonosDiscoverySession(const std::string &groupURL = SSDP_DEFAULT_GROUP_URL);

    //! Close the socket, failures are logged
    ~SonosDiscoverySession(void);

    /*!
     * Send the search request and collect replies.
     * Every call sends a fresh request, nothing is cached between calls.
     * \throws SonosDiscoveryError SEND_FAILED when the request is not sent
     * \param timeoutSeconds overall duration of the search
     * \param maxDevices stop as soon as this many devices are found
     * \return the IP addresses of the discovered devices
     */
    std::set<std::string> start(
        const int timeoutSeconds = SONOS_DISCOVERY_DEFAULT_TIMEOUT_SECONDS,
        const size_t maxDevices = SONOS_DISCOVERY_UNBOUNDED_DEVICES);

    /*!
     * Release the socket and stop the receive worker.
     * Calling close more than once is harmless.
     */
    void close(void);

    //! Get the current lifecycle state
    State getState(void) const
    {
        return _state;
    }

    //! Get the resolved multicast group url
    std::string getGroupURL(void) const
    {
        return _groupURL;
    }

    /*!
     * Get the hop limit applied to the search request.
     * Return the TTL or negative error when the session is closed.
     */
    int getMulticastTTL(void) const;

private:
    SonosSocketSession _sess;
    std::string _groupURL;
    std::string _request;
    std::shared_ptr<SonosDatagramSocket> _sock;
    std::unique_ptr<SonosReplyCollector> _collector;
    State _state;
};
