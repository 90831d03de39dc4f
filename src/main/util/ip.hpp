#pragma once

#include <string>

namespace moordns {

bool isValidIPv4(const std::string&);
bool isValidIPv6(const std::string&);
/// IPv4 or IPv6 literal, no brackets, no zone, no port
bool isIPLiteral(const std::string&);

}
