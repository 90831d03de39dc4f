#include "config.hpp"

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace moordns::config {

void to_json(json& j, const Snapshot& s){
	j["containers"] = s.containers;
	if(s.services) j["services"] = *s.services;
}
void from_json(const json& j, Snapshot& s){
	j.at("containers").get_to(s.containers);
	if(s.containers.empty()) throw json::type_error::create(301, "Container list path can't be empty", &j);
	if(j.contains("services")){
		s.services = j.at("services").get<std::string>();
		if(s.services->empty()) throw json::type_error::create(301, "Service list path can't be empty", &j);
	}
}

void to_json(json& j, const Config& c){
	if(c.swarmMode) j["swarm_mode"] = true;
	j["log_level"] = log::levelName(c.logLevel);
	j["snapshot"] = c.snapshot;
}
void from_json(const json& j, Config& c){
	if(j.contains("swarm_mode")) j.at("swarm_mode").get_to(c.swarmMode);
	if(j.contains("log_level")){
		auto str = j.at("log_level").get<std::string>();
		auto lvl = log::levelFromName(str);
		if(!lvl) throw json::type_error::create(301, "Unknown log level '" + str + "'", &j);
		c.logLevel = *lvl;
	}
	j.at("snapshot").get_to(c.snapshot);
}

result<Config, std::string> parse(std::istream& is){
	try {
		json j;
		is >> j;
		return j.get<Config>();
	} catch(json::exception& exc){
		return std::string(exc.what());
	}
}
result<void, std::string> serialize(std::ostream& os, const Config& cfg){
	try {
		json j(cfg);
		os << j;
		return result<void, std::string>::Ok();
	} catch(json::exception& exc){
		return std::string(exc.what());
	}
}

}
