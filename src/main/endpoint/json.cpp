#include "endpoint.hpp"

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace moordns {

void to_json(json& j, const Endpoint& ep){
	j["dnsName"] = ep.dnsName;
	j["targets"] = ep.targets;
	j["recordType"] = recordTypeName(ep.recordType);
	j["setIdentifier"] = ep.setIdentifier;
	j["recordTTL"] = ep.recordTTL;
	j["labels"] = json::object();
	for(const auto& l : ep.labels) j["labels"][l.first] = l.second;
	j["providerSpecific"] = json::array();
	for(const auto& ps : ep.providerSpecific) j["providerSpecific"].push_back(json{{"name", ps.first}, {"value", ps.second}});
}

result<void, std::string> serialize(std::ostream& os, const std::vector<Endpoint>& endpoints, int indent){
	try {
		json j = json::array();
		for(const auto& ep : endpoints) j.push_back(ep);
		os << j.dump(indent);
		return result<void, std::string>::Ok();
	} catch(json::exception& exc){
		return std::string(exc.what());
	}
}

}
