#include "annotations.hpp"

#include <charconv>
#include <util/strim.hpp>

namespace moordns::annot {

std::string ParseError::to_string() const {
	return "label " + key + "=\"" + value + "\": " + desc;
}

static std::optional<std::string> get(const LabelMap& labels, const std::string& key){
	auto it = labels.find(key);
	if(it == labels.end()) return std::nullopt;
	return it->second;
}

static std::optional<std::string> getNonEmpty(const LabelMap& labels, const std::string& key){
	auto v = get(labels, key);
	if(v && v->empty()) return std::nullopt;
	return v;
}

std::vector<std::string> hostnames(const LabelMap& labels){
	if(auto v = get(labels, HOSTNAME_KEY)) return splitTrimmed(*v, ',');
	return {};
}

result<std::optional<TTL>, ParseError> ttl(const LabelMap& labels){
	auto v = get(labels, TTL_KEY);
	if(!v) return std::optional<TTL>{};
	auto str = *v;
	trim(str);
	if(beginsWith(str, "+")) str.erase(0, 1);
	TTL val = 0;
	auto [end, ec] = std::from_chars(str.data(), str.data() + str.size(), val, 10);
	if(str.empty() || ec != std::errc() || end != str.data() + str.size())
		return ParseError{TTL_KEY, *v, "not a valid TTL value"};
	if(val < 0 || val > TTL_MAX) return ParseError{TTL_KEY, *v, "TTL value must be between [0, " + std::to_string(TTL_MAX) + "]"};
	return std::optional<TTL>{val};
}

Targets explicitTargets(const LabelMap& labels){
	Targets targets;
	if(auto v = get(labels, TARGET_KEY)) for(auto t : splitTrimmed(*v, ',')){
		if(endsWith(t, ".")) t.pop_back();
		if(!t.empty()) targets.push_back(std::move(t));
	}
	return targets;
}

ProviderOptions providerSpecific(const LabelMap& labels){
	ProviderOptions opts;
	const std::string aws = AWS_PREFIX;
	const std::string scw = SCW_PREFIX;
	for(const auto& l : labels){
		if(l.first == SET_IDENTIFIER_KEY) opts.setIdentifier = l.second;
		else if(l.first == CLOUDFLARE_PROXIED_KEY) opts.properties[l.first] = l.second;
		else if(l.first == ALIAS_KEY){ if(l.second == "true") opts.properties["alias"] = "true"; }
		else if(beginsWith(l.first, aws)) opts.properties["aws/" + l.first.substr(aws.length())] = l.second;
		else if(beginsWith(l.first, scw)) opts.properties["scw/" + l.first.substr(scw.length())] = l.second;
	}
	return opts;
}

std::optional<std::string> preferredNetwork(const LabelMap& labels){ return get(labels, NETWORK_KEY); }

std::optional<std::string> composeService(const LabelMap& labels){ return getNonEmpty(labels, COMPOSE_SERVICE_KEY); }
std::optional<std::string> swarmServiceId(const LabelMap& labels){ return getNonEmpty(labels, SWARM_SERVICE_ID_KEY); }
std::optional<std::string> swarmServiceName(const LabelMap& labels){ return getNonEmpty(labels, SWARM_SERVICE_NAME_KEY); }

}
