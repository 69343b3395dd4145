// Copyright (c) 2015-2020 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include <SoapySDR/Logger.hpp>
#include "SonosDiscoverySession.hpp"
#include "SonosDiscoveryError.hpp"
#include "SonosReplyCollector.hpp"
#include "SonosSSDPUtils.hpp"
#include "SonosURLUtils.hpp"
#include <chrono>

SonosDiscoverySession::SonosDiscoverySession(const std::string &groupURL):
    _request(formatMSearchRequest()),
    _state(CONSTRUCTED)
{
    //validate the group before any socket is made
    SonosURL url(groupURL);
    if (url.getScheme().empty()) url.setScheme("udp");
    if (url.getScheme() != "udp") throw SonosDiscoveryError(SonosDiscoveryError::INVALID_ADDRESS,
        "SonosDiscoverySession("+groupURL+") -- address FAIL: unsupported scheme " + url.getScheme());

    SockAddrData addr;
    const auto errorMsg = url.toSockAddr(addr, true);
    if (not errorMsg.empty()) throw SonosDiscoveryError(SonosDiscoveryError::INVALID_ADDRESS,
        "SonosDiscoverySession("+groupURL+") -- address FAIL: " + errorMsg);
    _groupURL = url.toString();

    _sock.reset(new SonosDatagramSocket());
    if (_sock->multicastSender(_groupURL, SSDP_MULTICAST_TTL) != 0) throw SonosDiscoveryError(SonosDiscoveryError::SOCKET_CREATION_FAILED,
        "SonosDiscoverySession("+_groupURL+") -- socket FAIL: " + _sock->lastErrorMsg());

    _collector.reset(new SonosReplyCollector(_sock));
    SoapySDR::logf(SOAPY_SDR_DEBUG, "SonosDiscoverySession created for %s (ttl %d)", _groupURL.c_str(), this->getMulticastTTL());
}

SonosDiscoverySession::~SonosDiscoverySession(void)
{
    this->close();
}

std::set<std::string> SonosDiscoverySession::start(const int timeoutSeconds, const size_t maxDevices)
{
    if (_state == CLOSED) throw SonosDiscoveryError(SonosDiscoveryError::SEND_FAILED,
        "SonosDiscoverySession::start("+_groupURL+") -- send FAIL: session closed");

    int ret = _sock->sendto(_request.data(), _request.size(), _groupURL);
    if (ret != int(_request.size())) throw SonosDiscoveryError(SonosDiscoveryError::SEND_FAILED,
        "SonosDiscoverySession::start("+_groupURL+") -- send FAIL: " + _sock->lastErrorMsg());
    _state = SEARCH_SENT;
    SoapySDR::logf(SOAPY_SDR_TRACE, "SonosDiscoverySession::start() sent search from %s", _sock->getsockname().c_str());

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeoutSeconds > 0 ? timeoutSeconds : 0);

    _state = COLLECTING;
    const auto devices = _collector->collect(deadline, maxDevices);
    _state = COMPLETED;

    SoapySDR::logf(SOAPY_SDR_DEBUG, "SonosDiscoverySession::start() found %d device(s)", int(devices.size()));
    return devices;
}

int SonosDiscoverySession::getMulticastTTL(void) const
{
    if (_state == CLOSED) return -1;
    return _sock->getMulticastTTL();
}

void SonosDiscoverySession::close(void)
{
    if (_state == CLOSED) return;
    _state = CLOSED;

    //the worker shares the socket, stop it before the close
    _collector->shutdown();

    if (_sock->close() != 0)
    {
        SoapySDR::logf(SOAPY_SDR_ERROR, "SonosDiscoverySession::close(%s) %s", _groupURL.c_str(), _sock->lastErrorMsg().c_str());
    }
}
