// Copyright (c) 2015-2015 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#pragma once
#include <SoapySDR/Config.hpp>

/***********************************************************************
 * API export defines
 **********************************************************************/
#ifdef SONOS_DISCOVERY_DLL // defined if SonosDiscovery is compiled as a DLL
  #ifdef SONOS_DISCOVERY_DLL_EXPORTS // defined if we are building the DLL (instead of using it)
    #define SONOS_DISCOVERY_API SOAPY_SDR_HELPER_DLL_EXPORT
  #else
    #define SONOS_DISCOVERY_API SOAPY_SDR_HELPER_DLL_IMPORT
  #endif // SONOS_DISCOVERY_DLL_EXPORTS
#else // SONOS_DISCOVERY_DLL is not defined: this means it is a static lib.
  #define SONOS_DISCOVERY_API SOAPY_SDR_HELPER_DLL_EXPORT
#endif // SONOS_DISCOVERY_DLL
