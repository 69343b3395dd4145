// Copyright (c) 2015-2020 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SonosDiscoveryDefs.hpp"
#include <string>

/*!
 * Format the SSDP M-SEARCH request for zone players.
 * Lines are joined with a bare LF and the message has no
 * leading or trailing whitespace; devices drop other framing.
 * \param host the HOST field value (group address and port)
 * \param mx the maximum reply delay in seconds
 * \param st the search target
 * \param man the mandatory extension, without quotes
 */
SONOS_DISCOVERY_API std::string formatMSearchRequest(
    const std::string &host = SSDP_MULTICAST_ADDR_IPV4 ":" SSDP_UDP_PORT_NUMBER,
    const int mx = SSDP_SEARCH_MX,
    const std::string &st = SONOS_ZONE_PLAYER_TARGET,
    const std::string &man = "ssdp:discover"
);
