// Copyright (c) 2015-2020 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SonosDiscoveryConfig.hpp"
#include <stdexcept>
#include <string>

/*!
 * Hard failures of a discovery session.
 * Only construction and the search send raise errors,
 * problems while collecting replies are logged and skipped.
 */
class SONOS_DISCOVERY_API SonosDiscoveryError : public std::runtime_error
{
public:
    enum Code
    {
        INVALID_ADDRESS,        //!< malformed multicast group override
        SOCKET_CREATION_FAILED, //!< the OS socket could not be made or configured
        SEND_FAILED,            //!< the search request was not transmitted
    };

    SonosDiscoveryError(const Code code, const std::string &what):
        std::runtime_error(what),
        _code(code)
    {
        return;
    }

    Code code(void) const
    {
        return _code;
    }

private:
    Code _code;
};
