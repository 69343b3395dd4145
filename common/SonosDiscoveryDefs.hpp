// Copyright (c) 2015-2020 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SonosDiscoveryConfig.hpp"
#include <cstddef>

/***********************************************************************
 * SSDP protocol constants
 **********************************************************************/
//! IPv4 multi-cast address for SSDP communications
#define SSDP_MULTICAST_ADDR_IPV4 "239.255.255.250"

//! UDP service port number for SSDP communications
#define SSDP_UDP_PORT_NUMBER "1900"

//! The well-known group used when no override is given
#define SSDP_DEFAULT_GROUP_URL "udp://" SSDP_MULTICAST_ADDR_IPV4 ":" SSDP_UDP_PORT_NUMBER

//! UPnP 1.0 mandates a multicast TTL of 4
#define SSDP_MULTICAST_TTL 4

//! Maximum wait in seconds that devices may delay their reply
#define SSDP_SEARCH_MX 1

//! Search target for Sonos zone players
#define SONOS_ZONE_PLAYER_TARGET "urn:schemas-upnp-org:device:ZonePlayer:1"

//! Replies count as a discovered device when the payload contains this
#define SONOS_REPLY_SIGNATURE "Sonos"

/***********************************************************************
 * Discovery defaults
 **********************************************************************/
//! Default overall search duration
#define SONOS_DISCOVERY_DEFAULT_TIMEOUT_SECONDS 5

//! Use this device count to search until the timeout
#define SONOS_DISCOVERY_UNBOUNDED_DEVICES (~size_t(0))

//! Maximum wait on a single receive before rechecking the deadline
#define SONOS_DISCOVERY_ATTEMPT_TIMEOUT_US (500*1000) //500 ms

//! Largest reply datagram that is inspected, longer replies are truncated
#define SONOS_DISCOVERY_RECV_MTU 1024

//! Use this timeout for every socket poll loop
#define SONOS_DISCOVERY_SOCKET_TIMEOUT_US (100*1000) //100 ms
