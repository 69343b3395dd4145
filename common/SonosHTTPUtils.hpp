// Copyright (c) 2015-2020 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SonosDiscoveryConfig.hpp"
#include <cstddef>
#include <string>

/*!
 * Read-only view of an HTTP-style header in a received datagram.
 * Lines may end with CRLF or a bare LF.
 */
class SONOS_DISCOVERY_API SonosHTTPHeader
{
public:
    //! Create an HTTP header from a received datagram
    SonosHTTPHeader(const void *buff, const size_t length);

    //! Get the request/response line
    std::string getLine0(void) const;

    //! Read a field from the HTTP header (empty when missing)
    std::string getField(const std::string &key) const;

private:
    std::string _storage;
};
