#include "netres.hpp"

namespace moordns {

Targets resolveNetworkTarget(const NetworkMap& networks, const std::optional<std::string>& preferred){
	const NetworkAttachment* att = nullptr;
	if(preferred){
		auto it = networks.find(*preferred);
		if(it != networks.end()) att = &it->second;
	} else if(networks.size() == 1) att = &networks.begin()->second;
	if(!att || att->ipAddress.empty()) return {};
	return {att->ipAddress};
}

}
