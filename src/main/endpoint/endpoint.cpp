#include "endpoint.hpp"

#include <algorithm>
#include <sstream>
#include <util/ip.hpp>

namespace moordns {

const char* recordTypeName(RecordType t){
	switch(t){
		case RecordType::A: return "A";
		case RecordType::CNAME: return "CNAME";
		default: return "?";
	}
}

bool Endpoint::operator==(const Endpoint& other) const {
	return dnsName == other.dnsName
		&& targets == other.targets
		&& recordType == other.recordType
		&& setIdentifier == other.setIdentifier
		&& recordTTL == other.recordTTL
		&& labels == other.labels
		&& providerSpecific == other.providerSpecific;
}

std::ostream& operator<<(std::ostream& os, const Endpoint& ep){
	os << ep.dnsName << " " << ep.recordTTL << " IN " << recordTypeName(ep.recordType);
	for(const auto& t : ep.targets) os << " " << t;
	if(!ep.setIdentifier.empty()) os << " ;set=" << ep.setIdentifier;
	for(const auto& ps : ep.providerSpecific) os << " ;" << ps.first << "=" << ps.second;
	return os;
}

std::string Endpoint::to_string() const {
	std::ostringstream os;
	os << *this;
	return os.str();
}

RecordType inferRecordType(const Targets& targets){
	return std::all_of(targets.begin(), targets.end(), isIPLiteral) ? RecordType::A : RecordType::CNAME;
}

Endpoint endpointForHostname(const std::string& hostname, const Targets& targets, TTL ttl, const ProviderSpecific& providerSpecific, const std::optional<std::string>& setIdentifier){
	Endpoint ep;
	ep.dnsName = hostname;
	ep.recordType = inferRecordType(targets);
	switch(ep.recordType){
		case RecordType::A:
			ep.targets = targets;
			break;
		case RecordType::CNAME:
			ep.targets.push_back(*std::find_if_not(targets.begin(), targets.end(), isIPLiteral));
			break;
	}
	ep.setIdentifier = setIdentifier.value_or("");
	ep.recordTTL = ttl;
	ep.providerSpecific = providerSpecific;
	return ep;
}

}
