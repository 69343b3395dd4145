// Copyright (c) 2015-2020 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SonosSocketDefs.hpp"
#include "SonosURLUtils.hpp"
#include <cstring> //memset, memcpy
#include <string>

SockAddrData::SockAddrData(void)
{
    return;
}

SockAddrData::SockAddrData(const struct sockaddr *addr, const size_t addrlen)
{
    _storage.resize(addrlen);
    std::memcpy(_storage.data(), addr, addrlen);
}

const struct sockaddr *SockAddrData::addr(void) const
{
    return (const struct sockaddr *)_storage.data();
}

size_t SockAddrData::addrlen(void) const
{
    return _storage.size();
}

SonosURL::SonosURL(void)
{
    return;
}

SonosURL::SonosURL(const std::string &url)
{
    //extract the scheme
    std::string urlRest = url;
    const auto schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos)
    {
        _scheme = url.substr(0, schemeEnd);
        urlRest = url.substr(schemeEnd+3);
    }

    //extract node name and service port
    bool inBracket = false;
    bool inService = false;
    for (const char ch : urlRest)
    {
        if (inBracket and ch == ']')
        {
            inBracket = false;
            continue;
        }
        if (not inBracket and not inService and ch == '[')
        {
            inBracket = true;
            continue;
        }
        if (inBracket) _node += ch;
        else if (inService) _service += ch;
        else if (ch == ':') inService = true;
        else _node += ch;
    }
}

SonosURL::SonosURL(const struct sockaddr *addr)
{
    //discovery sockets are IPv4 only, other families leave the url empty
    if (addr->sa_family != AF_INET) return;

    char s[INET_ADDRSTRLEN];
    auto *addr_in = (const struct sockaddr_in *)addr;
    if (inet_ntop(AF_INET, (void *)&(addr_in->sin_addr), s, sizeof(s)) != NULL) _node = s;
    _service = std::to_string(ntohs(addr_in->sin_port));
}

std::string SonosURL::toSockAddr(SockAddrData &addr, const bool numericOnly) const
{
    //unspecified node or service, cant continue
    if (_node.empty()) return "node not specified";
    if (_service.empty()) return "service not specified";

    //configure the hint, discovery is IPv4 datagram only
    struct addrinfo hints, *servinfo = NULL;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    if (numericOnly) hints.ai_flags = AI_NUMERICHOST | AI_NUMERICSERV;

    //get address info
    int ret = getaddrinfo(_node.c_str(), _service.c_str(), &hints, &servinfo);
    if (ret != 0) return gai_strerror(ret);

    //first IPv4 match wins
    struct addrinfo *p = NULL;
    for (p = servinfo; p != NULL; p = p->ai_next)
    {
        if (p->ai_family != AF_INET) continue;
        addr = SockAddrData(p->ai_addr, p->ai_addrlen);
        break;
    }

    //cleanup
    freeaddrinfo(servinfo);

    //no results
    if (p == NULL) return "no lookup results";

    return ""; //OK
}

std::string SonosURL::toString(void) const
{
    std::string url;

    //add the scheme
    if (not _scheme.empty()) url += _scheme + "://";

    //add the node with ipv6 escape brackets
    if (_node.find(":") != std::string::npos) url += "[" + _node + "]";
    else url += _node;

    //and the service
    if (not _service.empty()) url += ":" + _service;

    return url;
}

std::string SonosURL::getScheme(void) const
{
    return _scheme;
}

std::string SonosURL::getNode(void) const
{
    return _node;
}

std::string SonosURL::getService(void) const
{
    return _service;
}

void SonosURL::setScheme(const std::string &scheme)
{
    _scheme = scheme;
}
