// Copyright (c) 2015-2020 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SonosSSDPUtils.hpp"

std::string formatMSearchRequest(
    const std::string &host,
    const int mx,
    const std::string &st,
    const std::string &man
){
    std::string out;
    out += "M-SEARCH * HTTP/1.1\n";
    out += "HOST: "+host+"\n";
    out += "MAN: \""+man+"\"\n";
    out += "MX: "+std::to_string(mx)+"\n";
    out += "ST: "+st;
    return out;
}
