// Copyright (c) 2015-2020 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include "SonosDiscoveryConfig.hpp"
#include <string>

namespace SonosInfo
{
    /*!
     * Get the version string for this build.
     */
    SONOS_DISCOVERY_API std::string getVersion(void);

    /*!
     * Get the system and library description for this build.
     */
    SONOS_DISCOVERY_API std::string getBuildInfo(void);
};
