#include "ip.hpp"

#ifdef _WIN32
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#endif

namespace moordns {

bool isValidIPv4(const std::string& str){
	::in_addr addr;
	return ::inet_pton(AF_INET, str.c_str(), &addr) == 1;
}

bool isValidIPv6(const std::string& str){
	::in6_addr addr;
	return ::inet_pton(AF_INET6, str.c_str(), &addr) == 1;
}

bool isIPLiteral(const std::string& str){ return isValidIPv4(str) || isValidIPv6(str); }

}
