// Copyright (c) 2015-2020 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SonosDiscoverySession.hpp"
#include "SonosInfoUtils.hpp"
#include <SoapySDR/Logger.hpp>
#include <cstdlib>
#include <cstddef>
#include <cctype>
#include <string>
#include <iostream>
#include <getopt.h>

/***********************************************************************
 * Print help message
 **********************************************************************/
static int printHelp(void)
{
    std::cout << "Usage SonosDiscover [options]" << std::endl;
    std::cout << "  Options summary:" << std::endl;
    std::cout << "    --help \t\t\t\t Print this help message" << std::endl;
    std::cout << "    --version \t\t\t\t Print the version and exit" << std::endl;
    std::cout << "    --timeout=<seconds> \t\t Search duration (default " << SONOS_DISCOVERY_DEFAULT_TIMEOUT_SECONDS << ")" << std::endl;
    std::cout << "    --count=<devices> \t\t\t Stop after this many devices" << std::endl;
    std::cout << "    --addr=<ip:port> \t\t\t Multicast group (default " << SSDP_MULTICAST_ADDR_IPV4 << ":" << SSDP_UDP_PORT_NUMBER << ")" << std::endl;
    std::cout << "    --log-level=<level> \t\t trace, debug, info, warning, error" << std::endl;
    std::cout << std::endl;
    return EXIT_SUCCESS;
}

/***********************************************************************
 * Log level from name or number
 **********************************************************************/
static bool parseLogLevel(const std::string &arg, SoapySDR::LogLevel &level)
{
    std::string name;
    for (const char ch : arg) name += char(std::tolower((unsigned char)ch));

    if (name == "fatal") level = SOAPY_SDR_FATAL;
    else if (name == "critical") level = SOAPY_SDR_CRITICAL;
    else if (name == "error") level = SOAPY_SDR_ERROR;
    else if (name == "warning") level = SOAPY_SDR_WARNING;
    else if (name == "notice") level = SOAPY_SDR_NOTICE;
    else if (name == "info") level = SOAPY_SDR_INFO;
    else if (name == "debug") level = SOAPY_SDR_DEBUG;
    else if (name == "trace") level = SOAPY_SDR_TRACE;
    else
    {
        try {level = SoapySDR::LogLevel(std::stoi(name));}
        catch (const std::exception &) {return false;}
    }
    return true;
}

/***********************************************************************
 * Run the search and print the results
 **********************************************************************/
static int runDiscover(const std::string &addr, const int timeoutSeconds, const size_t maxDevices)
{
    try
    {
        SonosDiscoverySession session(addr);
        std::cerr << "Searching " << session.getGroupURL() << " (ttl " << session.getMulticastTTL() << ") for " << timeoutSeconds << " seconds..." << std::endl;
        const auto devices = session.start(timeoutSeconds, maxDevices);
        for (const auto &device : devices) std::cout << device << std::endl;
        std::cerr << "Found " << devices.size() << " device(s)" << std::endl;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Discovery FAIL: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

/***********************************************************************
 * Parse and dispatch options
 **********************************************************************/
int main(int argc, char *argv[])
{
    std::string addr(SSDP_DEFAULT_GROUP_URL);
    int timeoutSeconds(SONOS_DISCOVERY_DEFAULT_TIMEOUT_SECONDS);
    size_t maxDevices(SONOS_DISCOVERY_UNBOUNDED_DEVICES);

    /*******************************************************************
     * parse command line options
     ******************************************************************/
    static struct option long_options[] = {
        {"help", no_argument, 0, 'h'},
        {"version", no_argument, 0, 'v'},
        {"timeout", required_argument, 0, 't'},
        {"count", required_argument, 0, 'c'},
        {"addr", required_argument, 0, 'a'},
        {"log-level", required_argument, 0, 'l'},
        {0, 0, 0,  0}
    };
    int long_index = 0;
    int option = 0;
    while ((option = getopt_long_only(argc, argv, "", long_options, &long_index)) != -1)
    {
        try
        {
            switch (option)
            {
            case 'h': return printHelp();
            case 'v':
                std::cout << "SonosDiscover " << SonosInfo::getVersion() << " (" << SonosInfo::getBuildInfo() << ")" << std::endl;
                return EXIT_SUCCESS;
            case 't': timeoutSeconds = std::stoi(optarg); break;
            case 'c': maxDevices = size_t(std::stoul(optarg)); break;
            case 'a': addr = optarg; break;
            case 'l':
            {
                SoapySDR::LogLevel level;
                if (not parseLogLevel(optarg, level))
                {
                    std::cerr << "Unknown log level: " << optarg << std::endl;
                    return EXIT_FAILURE;
                }
                SoapySDR::setLogLevel(level);
                break;
            }
            default:
                printHelp();
                return EXIT_FAILURE;
            }
        }
        catch (const std::exception &)
        {
            std::cerr << "Invalid value for --" << long_options[long_index].name << ": " << optarg << std::endl;
            return EXIT_FAILURE;
        }
    }

    return runDiscover(addr, timeoutSeconds, maxDevices);
}
