// Copyright (c) 2015-2020 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "TestResponder.hpp"
#include "SonosDiscoverySession.hpp"
#include "SonosDiscoveryError.hpp"
#include "SonosSSDPUtils.hpp"
#include <iostream>
#include <string>
#include <set>

static const std::string SONOS_PAYLOAD =
    "HTTP/1.1 200 OK\r\n"
    "LOCATION: http://127.0.0.5:1400/xml/device_description.xml\r\n"
    "SERVER: Linux UPnP/1.0 Sonos/70.3-35220 (ZPS12)\r\n"
    "ST: urn:schemas-upnp-org:device:ZonePlayer:1\r\n\r\n";

static const std::string OTHER_PAYLOAD = "HTTP/1.1 200 OK\r\nST: other-service";

//! Construct and report the error code, or -1 when construction succeeds
static int constructError(const std::string &addr)
{
    try
    {
        SonosDiscoverySession session(addr);
    }
    catch (const SonosDiscoveryError &ex)
    {
        return ex.code();
    }
    return -1;
}

int main(void)
{
    int failures = 0;
    const auto attemptTimeout = 0.5;
    const auto slack = 0.2;

    // Test 1: malformed group overrides fail construction
    {
        const char *bad[] = {"not-an-address", "udp://not-an-address:1900", "239.255.255.250", "tcp://239.255.255.250:1900"};
        for (const auto *addr : bad)
        {
            if (constructError(addr) != SonosDiscoveryError::INVALID_ADDRESS)
            {
                std::cerr << "[FAIL] '" << addr << "' should fail with INVALID_ADDRESS\n";
                ++failures;
            }
        }
    }

    // Test 2: default group
    {
        SonosDiscoverySession session;
        if (session.getGroupURL() != "udp://239.255.255.250:1900")
        {
            std::cerr << "[FAIL] default group is " << session.getGroupURL() << "\n";
            ++failures;
        }
        if (session.getState() != SonosDiscoverySession::CONSTRUCTED)
        {
            std::cerr << "[FAIL] new session not in CONSTRUCTED state\n";
            ++failures;
        }
        if (session.getMulticastTTL() != 4)
        {
            std::cerr << "[FAIL] multicast TTL is " << session.getMulticastTTL() << "\n";
            ++failures;
        }
    }

    // Test 3: one responder, count satisfied before the deadline
    {
        TestResponder responder({TestReply("127.0.0.5", SONOS_PAYLOAD)});
        SonosDiscoverySession session(responder.url());

        const auto start = std::chrono::steady_clock::now();
        const auto devices = session.start(1, 1);
        const auto elapsed = secondsSince(start);

        if (devices != std::set<std::string>{"127.0.0.5"})
        {
            std::cerr << "[FAIL] expected 127.0.0.5, got " << devices.size() << " devices\n";
            ++failures;
        }
        if (elapsed >= 1.0)
        {
            std::cerr << "[FAIL] search waited " << elapsed << " seconds after the count was reached\n";
            ++failures;
        }
        if (responder.lastQuery() != formatMSearchRequest())
        {
            std::cerr << "[FAIL] responder got an unexpected request:\n" << responder.lastQuery() << "\n";
            ++failures;
        }
        if (session.getState() != SonosDiscoverySession::COMPLETED)
        {
            std::cerr << "[FAIL] session not COMPLETED after start\n";
            ++failures;
        }
    }

    // Test 4: duplicate replies and other services
    {
        TestResponder responder({
            TestReply("127.0.0.6", SONOS_PAYLOAD),
            TestReply("127.0.0.6", SONOS_PAYLOAD),
            TestReply("127.0.0.6", SONOS_PAYLOAD),
            TestReply("127.0.0.7", OTHER_PAYLOAD),
            TestReply("127.0.0.8", SONOS_PAYLOAD),
        });
        SonosDiscoverySession session(responder.url());

        const auto start = std::chrono::steady_clock::now();
        const auto devices = session.start(1);
        const auto elapsed = secondsSince(start);

        if (devices != std::set<std::string>{"127.0.0.6", "127.0.0.8"})
        {
            std::cerr << "[FAIL] expected 127.0.0.6 and 127.0.0.8, got " << devices.size() << " devices\n";
            ++failures;
        }
        if (elapsed < 1.0 or elapsed > 1.0 + attemptTimeout + slack)
        {
            std::cerr << "[FAIL] unbounded search took " << elapsed << " seconds\n";
            ++failures;
        }
    }

    // Test 5: nothing qualifies, empty result after the full timeout
    {
        TestResponder responder({TestReply("127.0.0.9", OTHER_PAYLOAD)});
        SonosDiscoverySession session(responder.url());

        const auto start = std::chrono::steady_clock::now();
        const auto devices = session.start(1, 3);
        const auto elapsed = secondsSince(start);

        if (not devices.empty() or elapsed < 1.0 or elapsed > 1.0 + attemptTimeout + slack)
        {
            std::cerr << "[FAIL] idle search returned " << devices.size() << " devices after " << elapsed << " seconds\n";
            ++failures;
        }
    }

    // Test 6: every start sends a new request
    {
        TestResponder responder({TestReply("127.0.0.10", SONOS_PAYLOAD)});
        SonosDiscoverySession session(responder.url());

        const auto first = session.start(1, 1);
        const auto second = session.start(1, 1);
        if (first.size() != 1 or second.size() != 1)
        {
            std::cerr << "[FAIL] repeated start returned " << first.size() << " and " << second.size() << " devices\n";
            ++failures;
        }
        if (responder.queries() != 2)
        {
            std::cerr << "[FAIL] responder saw " << responder.queries() << " requests\n";
            ++failures;
        }
    }

    // Test 7: default group round trip through multicast loopback
    {
        TestGroupMember member("127.0.0.5", SONOS_PAYLOAD);
        if (not member.error().empty())
        {
            std::cout << "[SKIP] default group round trip: " << member.error() << "\n";
        }
        else
        {
            SonosDiscoverySession session;
            std::set<std::string> devices;
            try
            {
                devices = session.start(2, 1);
            }
            catch (const SonosDiscoveryError &ex)
            {
                std::cerr << "[FAIL] search on the default group: " << ex.what() << "\n";
                ++failures;
            }
            if (devices != std::set<std::string>{"127.0.0.5"} or member.queries() < 1)
            {
                std::cerr << "[FAIL] default group search found " << devices.size() << " devices after " << member.queries() << " requests\n";
                ++failures;
            }
        }
    }

    // Test 8: close is idempotent and ends the session
    {
        SonosDiscoverySession session("127.0.0.1:9");
        session.close();
        session.close();
        if (session.getState() != SonosDiscoverySession::CLOSED)
        {
            std::cerr << "[FAIL] session not CLOSED after close\n";
            ++failures;
        }
        if (session.getMulticastTTL() >= 0)
        {
            std::cerr << "[FAIL] closed session reports a TTL\n";
            ++failures;
        }

        int code = -1;
        try
        {
            session.start(1);
        }
        catch (const SonosDiscoveryError &ex)
        {
            code = ex.code();
        }
        if (code != SonosDiscoveryError::SEND_FAILED)
        {
            std::cerr << "[FAIL] start on a closed session should fail with SEND_FAILED\n";
            ++failures;
        }
    }

    if (failures == 0) std::cout << "[PASS] TestDiscoverySession\n";
    return failures == 0 ? 0 : 1;
}
