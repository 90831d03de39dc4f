#include "container.hpp"

namespace moordns {

std::string Container::displayName() const {
	if(!names.empty()){
		auto n = names.front();
		if(!n.empty() && n[0] == '/') n.erase(0, 1);
		return n;
	}
	return id.substr(0, 12);
}

}
