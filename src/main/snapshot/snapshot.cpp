#include "snapshot.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace moordns {

/*
 * The runtime API uses PascalCase member names and omits or nulls members freely,
 * so everything but the identifiers is optional.
 */

template<typename T> static void getOpt(const json& j, const char* key, T& to){
	if(j.contains(key) && !j.at(key).is_null()) j.at(key).get_to(to);
}

void from_json(const json& j, NetworkAttachment& n){
	getOpt(j, "IPAddress", n.ipAddress);
	getOpt(j, "Gateway", n.gateway);
}

void from_json(const json& j, Container& c){
	j.at("Id").get_to(c.id);
	getOpt(j, "Names", c.names);
	getOpt(j, "Labels", c.labels);
	if(j.contains("NetworkSettings") && !j.at("NetworkSettings").is_null()) getOpt(j.at("NetworkSettings"), "Networks", c.networks);
}

void from_json(const json& j, ServicePort& p){
	getOpt(j, "Protocol", p.protocol);
	getOpt(j, "TargetPort", p.targetPort);
	getOpt(j, "PublishedPort", p.publishedPort);
	getOpt(j, "PublishMode", p.publishMode);
}

void from_json(const json& j, ServiceVirtualIP& v){
	getOpt(j, "NetworkID", v.networkId);
	getOpt(j, "Addr", v.addr);
}

void from_json(const json& j, ServiceDescriptor& s){
	j.at("ID").get_to(s.id);
	if(j.contains("Spec") && !j.at("Spec").is_null()) getOpt(j.at("Spec"), "Name", s.name);
	if(j.contains("Endpoint") && !j.at("Endpoint").is_null()){
		const auto& ep = j.at("Endpoint");
		if(ep.contains("Spec") && !ep.at("Spec").is_null()) getOpt(ep.at("Spec"), "Mode", s.mode);
		getOpt(ep, "Ports", s.ports);
		getOpt(ep, "VirtualIPs", s.virtualIPs);
	}
}

}

namespace moordns::snapshot {

result<std::vector<Container>, std::string> parseContainers(std::istream& is){
	try {
		json j;
		is >> j;
		return j.get<std::vector<Container>>();
	} catch(json::exception& exc){
		return std::string(exc.what());
	}
}

result<ServiceMap, std::string> parseServices(std::istream& is){
	try {
		json j;
		is >> j;
		ServiceMap services;
		for(auto svc : j.get<std::vector<ServiceDescriptor>>()){
			auto id = svc.id;
			services[id] = std::move(svc);
		}
		return services;
	} catch(json::exception& exc){
		return std::string(exc.what());
	}
}

SnapshotClient::SnapshotClient(std::string cf, std::optional<std::string> sf) : containersFile(std::move(cf)), servicesFile(std::move(sf)) {}

result<std::vector<Container>, std::string> SnapshotClient::listContainers(){
	std::ifstream f(containersFile);
	if(f.fail()) return "couldn't read container list " + containersFile;
	return parseContainers(f);
}

result<ServiceMap, std::string> SnapshotClient::listServices(){
	if(!servicesFile) return ServiceMap{};
	std::ifstream f(*servicesFile);
	if(f.fail()) return "couldn't read service list " + *servicesFile;
	return parseServices(f);
}

}
