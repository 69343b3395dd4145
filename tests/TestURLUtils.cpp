// Copyright (c) 2015-2020 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SonosSocketDefs.hpp"
#include "SonosURLUtils.hpp"
#include <cstring>
#include <iostream>
#include <string>

int main(void)
{
    int failures = 0;

    // Test 1: markup parsing and formatting
    {
        SonosURL url("udp://239.255.255.250:1900");
        if (url.getScheme() != "udp" or url.getNode() != "239.255.255.250" or url.getService() != "1900")
        {
            std::cerr << "[FAIL] parse udp://239.255.255.250:1900 got " << url.getScheme() << " " << url.getNode() << " " << url.getService() << "\n";
            ++failures;
        }
        if (url.toString() != "udp://239.255.255.250:1900")
        {
            std::cerr << "[FAIL] toString " << url.toString() << "\n";
            ++failures;
        }

        SonosURL noScheme("10.0.0.5:1400");
        if (not noScheme.getScheme().empty() or noScheme.getNode() != "10.0.0.5" or noScheme.getService() != "1400")
        {
            std::cerr << "[FAIL] parse 10.0.0.5:1400\n";
            ++failures;
        }

        SonosURL bracketed("[ff02::c]:1900");
        if (bracketed.getNode() != "ff02::c" or bracketed.getService() != "1900" or bracketed.toString() != "[ff02::c]:1900")
        {
            std::cerr << "[FAIL] parse [ff02::c]:1900 got node " << bracketed.getNode() << "\n";
            ++failures;
        }
    }

    // Test 2: numeric lookup accepts IPv4 literals with a port
    {
        SockAddrData addr;
        const auto err = SonosURL("udp://239.255.255.250:1900").toSockAddr(addr, true);
        if (not err.empty() or addr.addrlen() == 0 or addr.addr()->sa_family != AF_INET)
        {
            std::cerr << "[FAIL] lookup of the SSDP group: " << err << "\n";
            ++failures;
        }
        else
        {
            auto *addr_in = (const struct sockaddr_in *)addr.addr();
            if (ntohs(addr_in->sin_port) != 1900)
            {
                std::cerr << "[FAIL] lookup port " << ntohs(addr_in->sin_port) << "\n";
                ++failures;
            }
        }
    }

    // Test 3: numeric lookup rejects malformed addresses
    {
        const char *bad[] = {"not-an-address", "not-an-address:1900", "10.0.0.5", "10.0.0.5:ssdp", "300.1.2.3:1900", "[ff02::c]:1900", ""};
        for (const auto *markup : bad)
        {
            SockAddrData addr;
            if (SonosURL(markup).toSockAddr(addr, true).empty())
            {
                std::cerr << "[FAIL] lookup of '" << markup << "' should fail\n";
                ++failures;
            }
        }
    }

    // Test 4: sender address formatting from a sockaddr
    {
        struct sockaddr_in addr_in;
        std::memset(&addr_in, 0, sizeof(addr_in));
        addr_in.sin_family = AF_INET;
        addr_in.sin_port = htons(1400);
        inet_pton(AF_INET, "10.0.0.5", &addr_in.sin_addr);

        SonosURL url((const struct sockaddr *)&addr_in);
        if (url.toString() != "10.0.0.5:1400" or url.getNode() != "10.0.0.5")
        {
            std::cerr << "[FAIL] sockaddr to url got " << url.toString() << "\n";
            ++failures;
        }
    }

    // Test 5: non IPv4 senders format as an empty url
    {
        struct sockaddr_in6 addr_in6;
        std::memset(&addr_in6, 0, sizeof(addr_in6));
        addr_in6.sin6_family = AF_INET6;
        addr_in6.sin6_port = htons(1400);
        inet_pton(AF_INET6, "fe80::1", &addr_in6.sin6_addr);

        SonosURL url((const struct sockaddr *)&addr_in6);
        if (not url.toString().empty())
        {
            std::cerr << "[FAIL] IPv6 sockaddr formatted as " << url.toString() << "\n";
            ++failures;
        }
    }

    if (failures == 0) std::cout << "[PASS] TestURLUtils\n";
    return failures == 0 ? 0 : 1;
}
