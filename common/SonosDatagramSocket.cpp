// Copyright (c) 2015-2020 Josh Blum
// SPDX-License-Identifier: BSL-1.0

/*
 * Multicast send docs:
 * http://www.tldp.org/HOWTO/Multicast-HOWTO-6.html
 */

#include "SonosSocketDefs.hpp"
#include "SonosDatagramSocket.hpp"
#include "SonosURLUtils.hpp"
#include <SoapySDR/Logger.hpp>
#include <cstring> //strerror

static std::mutex sessionMutex;
static size_t sessionCount = 0;

SonosSocketSession::SonosSocketSession(void)
{
    std::lock_guard<std::mutex> lock(sessionMutex);
    sessionCount++;
    if (sessionCount > 1) return;

    #ifdef _MSC_VER
    WORD wVersionRequested;
    WSADATA wsaData;
    wVersionRequested = MAKEWORD(2, 2);
    int ret = WSAStartup(wVersionRequested, &wsaData);
    if (ret != 0)
    {
        SoapySDR::logf(SOAPY_SDR_ERROR, "SonosSocketSession::WSAStartup: %d", ret);
    }
    #endif
}

SonosSocketSession::~SonosSocketSession(void)
{
    std::lock_guard<std::mutex> lock(sessionMutex);
    sessionCount--;
    if (sessionCount > 0) return;

    #ifdef _MSC_VER
    WSACleanup();
    #endif
}

SonosDatagramSocket::SonosDatagramSocket(void):
    _sock(INVALID_SOCKET)
{
    return;
}

SonosDatagramSocket::~SonosDatagramSocket(void)
{
    if (this->close() != 0)
    {
        SoapySDR::logf(SOAPY_SDR_ERROR, "SonosDatagramSocket::~SonosDatagramSocket: %s", this->lastErrorMsg().c_str());
    }
}

bool SonosDatagramSocket::null(void) const
{
    return _sock == INVALID_SOCKET;
}

int SonosDatagramSocket::close(void)
{
    if (this->null()) return 0;
    int ret = ::closesocket(_sock);
    _sock = INVALID_SOCKET;
    if (ret != 0) this->reportError("closesocket()");
    return ret;
}

int SonosDatagramSocket::multicastSender(const std::string &group, const int ttl, const bool loop)
{
    //lookup group url
    SonosURL urlObj(group);
    SockAddrData addr;
    const auto errorMsg = urlObj.toSockAddr(addr, true);
    if (not errorMsg.empty())
    {
        this->reportError("getaddrinfo("+group+")", errorMsg);
        return -1;
    }

    //create socket if null, protocol 0 selects UDP
    if (this->null()) _sock = ::socket(addr.addr()->sa_family, SOCK_DGRAM, 0);
    if (this->null())
    {
        this->reportError("socket("+group+")");
        return -1;
    }

    //setup IP_MULTICAST_LOOP
    int loopInt = loop?1:0;
    int ret = ::setsockopt(_sock, IPPROTO_IP, IP_MULTICAST_LOOP, (const char *)&loopInt, sizeof(loopInt));
    if (ret != 0)
    {
        this->reportError("setsockopt(IP_MULTICAST_LOOP)");
        return -1;
    }

    //setup IP_MULTICAST_TTL
    ret = ::setsockopt(_sock, IPPROTO_IP, IP_MULTICAST_TTL, (const char *)&ttl, sizeof(ttl));
    if (ret != 0)
    {
        this->reportError("setsockopt(IP_MULTICAST_TTL)");
        return -1;
    }

    return 0;
}

int SonosDatagramSocket::bind(const std::string &url)
{
    SonosURL urlObj(url);
    SockAddrData addr;
    const auto errorMsg = urlObj.toSockAddr(addr, true);
    if (not errorMsg.empty())
    {
        this->reportError("getaddrinfo("+url+")", errorMsg);
        return -1;
    }

    if (this->null()) _sock = ::socket(addr.addr()->sa_family, SOCK_DGRAM, 0);
    if (this->null())
    {
        this->reportError("socket("+url+")");
        return -1;
    }

    int ret = ::bind(_sock, addr.addr(), socklen_t(addr.addrlen()));
    if (ret == -1) this->reportError("bind("+url+")");
    return ret;
}

int SonosDatagramSocket::sendto(const void *buf, size_t len, const std::string &url)
{
    SockAddrData addr;
    const auto errorMsg = SonosURL(url).toSockAddr(addr, true);
    if (not errorMsg.empty())
    {
        this->reportError("getaddrinfo("+url+")", errorMsg);
        return -1;
    }

    int ret = ::sendto(_sock, (const char *)buf, int(len), 0, addr.addr(), socklen_t(addr.addrlen()));
    if (ret == -1) this->reportError("sendto("+url+")");
    return ret;
}

int SonosDatagramSocket::recvfrom(void *buf, size_t len, std::string &url)
{
    struct sockaddr_storage addr;
    socklen_t addrlen = sizeof(addr);
    int ret = ::recvfrom(_sock, (char *)buf, int(len), 0, (struct sockaddr*)&addr, &addrlen);
    if (ret == -1) this->reportError("recvfrom()");
    else url = SonosURL((const struct sockaddr *)&addr).toString();
    return ret;
}

int SonosDatagramSocket::selectRecv(const long timeoutUs)
{
    if (this->null())
    {
        this->reportError("select()", "socket closed");
        return -1;
    }
    #ifndef _MSC_VER
    if (_sock >= FD_SETSIZE)
    {
        this->reportError("select()", "descriptor exceeds FD_SETSIZE");
        return -1;
    }
    #endif

    struct timeval tv;
    tv.tv_sec = timeoutUs / 1000000;
    tv.tv_usec = timeoutUs % 1000000;

    fd_set readfds;
    FD_ZERO(&readfds);
    FD_SET(_sock, &readfds);

    int ret = ::select(_sock+1, &readfds, NULL, NULL, &tv);
    if (ret == -1 and SOCKET_ERRNO == SOCKET_EINTR) return 0;
    if (ret == -1) this->reportError("select()");
    return ret;
}

int SonosDatagramSocket::getMulticastTTL(void)
{
    int opt = 0;
    socklen_t optlen = sizeof(opt);
    int ret = ::getsockopt(_sock, IPPROTO_IP, IP_MULTICAST_TTL, (char *)&opt, &optlen);
    if (ret == -1) this->reportError("getsockopt(IP_MULTICAST_TTL)");
    if (ret != 0) return ret;
    return opt;
}

static std::string errToString(const int err)
{
    char buff[1024];
    #ifdef _MSC_VER
    FormatMessage(FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS, NULL, err, MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT), (LPTSTR)&buff, sizeof(buff), NULL);
    return buff;
    #else
    //http://linux.die.net/man/3/strerror_r
    #ifdef STRERROR_R_XSI
    if (strerror_r(err, buff, sizeof(buff)) != 0) return "unknown error";
    #else
    //this version may decide to use its own internal string
    return strerror_r(err, buff, sizeof(buff));
    #endif
    return buff;
    #endif
}

std::string SonosDatagramSocket::lastErrorMsg(void) const
{
    std::lock_guard<std::mutex> lock(_errorMutex);
    return _lastErrorMsg;
}

void SonosDatagramSocket::reportError(const std::string &what)
{
    this->reportError(what, SOCKET_ERRNO);
}

void SonosDatagramSocket::reportError(const std::string &what, const int err)
{
    if (err == 0) this->reportError(what, std::string());
    else this->reportError(what, std::to_string(err) + ": " + errToString(err));
}

void SonosDatagramSocket::reportError(const std::string &what, const std::string &errorMsg)
{
    std::lock_guard<std::mutex> lock(_errorMutex);
    if (errorMsg.empty()) _lastErrorMsg = what;
    else _lastErrorMsg = what + " [" + errorMsg + "]";
}

std::string SonosDatagramSocket::getsockname(void)
{
    struct sockaddr_storage addr;
    socklen_t addrlen = sizeof(addr);
    int ret = ::getsockname(_sock, (struct sockaddr *)&addr, &addrlen);
    if (ret == -1) this->reportError("getsockname()");
    if (ret != 0) return "";
    return SonosURL((const struct sockaddr *)&addr).toString();
}
