// Copyright (c) 2015-2020 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SonosDiscoveryConfig.hpp"
#include <cstddef>
#include <string>
#include <vector>

//forward declares
struct sockaddr;

//! A simple storage class for a sockaddr
class SONOS_DISCOVERY_API SockAddrData
{
public:
    //! Create an empty socket address
    SockAddrData(void);

    //! Create a socket address from a pointer and length
    SockAddrData(const struct sockaddr *addr, const size_t addrlen);

    //! Get a pointer to the underlying data
    const struct sockaddr *addr(void) const;

    //! Length of the underlying structure
    size_t addrlen(void) const;

private:
    std::vector<char> _storage;
};

/*!
 * URL parsing and lookup for datagram endpoints.
 * Markup examples:
 * udp://239.255.255.250:1900
 * 10.0.0.5:1400
 * [ff02::c]:1900
 */
class SONOS_DISCOVERY_API SonosURL
{
public:
    //! Create empty url object
    SonosURL(void);

    //! Parse from url markup string
    SonosURL(const std::string &url);

    //! Create URL from an IPv4 socket address (node and port, no scheme)
    SonosURL(const struct sockaddr *addr);

    /*!
     * Convert to an IPv4 socket address.
     * With numericOnly, the node must be an address literal
     * and the service a port number, no name lookup is done.
     * Return the error message on failure.
     */
    std::string toSockAddr(SockAddrData &addr, const bool numericOnly = false) const;

    /*!
     * Convert to URL string markup.
     */
    std::string toString(void) const;

    //! Get the scheme
    std::string getScheme(void) const;

    //! Get the node
    std::string getNode(void) const;

    //! Get the service
    std::string getService(void) const;

    //! Set the scheme
    void setScheme(const std::string &scheme);

private:
    std::string _scheme;
    std::string _node;
    std::string _service;
};
