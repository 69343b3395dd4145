// Copyright (c) 2015-2020 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SonosInfoUtils.hpp"

std::string SonosInfo::getVersion(void)
{
    return "@SONOS_DISCOVERY_VERSION@";
}

std::string SonosInfo::getBuildInfo(void)
{
    return "@CMAKE_SYSTEM_NAME@ SonosDiscovery/@SONOS_DISCOVERY_VERSION@ SoapySDR/@SoapySDR_VERSION@";
}
