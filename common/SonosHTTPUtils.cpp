// Copyright (c) 2015-2020 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SonosHTTPUtils.hpp"
#include <cctype>

static std::string trimLine(const std::string &line)
{
    size_t begin = 0, end = line.size();
    while (begin < end and std::isspace((unsigned char)line[begin])) begin++;
    while (end > begin and std::isspace((unsigned char)line[end-1])) end--;
    return line.substr(begin, end-begin);
}

SonosHTTPHeader::SonosHTTPHeader(const void *buff, const size_t length)
{
    _storage = std::string((const char *)buff, length);
}

std::string SonosHTTPHeader::getLine0(void) const
{
    const auto pos = _storage.find("\n");
    if (pos == std::string::npos) return trimLine(_storage);
    return trimLine(_storage.substr(0, pos));
}

std::string SonosHTTPHeader::getField(const std::string &key) const
{
    //walk the lines after the request/response line
    size_t pos = _storage.find("\n");
    while (pos != std::string::npos)
    {
        const size_t start = pos+1;
        pos = _storage.find("\n", start);
        const auto line = _storage.substr(start, (pos == std::string::npos)?std::string::npos:pos-start);

        //blank line ends the header
        const auto trimmed = trimLine(line);
        if (trimmed.empty()) break;

        //field names are case insensitive
        const auto colon = trimmed.find(":");
        if (colon != key.size()) continue;
        bool match = true;
        for (size_t i = 0; i < key.size() and match; i++)
        {
            match = std::toupper((unsigned char)trimmed[i]) == std::toupper((unsigned char)key[i]);
        }
        if (match) return trimLine(trimmed.substr(colon+1));
    }
    return "";
}
