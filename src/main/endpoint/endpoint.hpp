#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include <util/result.hpp>

namespace moordns {

/// Record TTL in seconds, 0 meaning "not configured"
using TTL = std::int64_t;
using Targets = std::vector<std::string>;
/// Opaque provider hints, ordered by name
using ProviderSpecific = std::map<std::string, std::string>;
using Labels = std::map<std::string, std::string>;

enum class RecordType {
	/// address record
	A,
	/// alias record
	CNAME,
};

const char* recordTypeName(RecordType);

struct Endpoint {
	std::string dnsName;
	Targets targets;
	RecordType recordType = RecordType::A;
	std::string setIdentifier;
	TTL recordTTL = 0;
	Labels labels;
	ProviderSpecific providerSpecific;
	bool operator==(const Endpoint& other) const;
	bool operator!=(const Endpoint& other) const { return !(*this == other); }
	std::string to_string() const;
};
std::ostream& operator<<(std::ostream&, const Endpoint&);

/**
 * Infers the record type from the shape of the targets.
 * A list made only of IP literals (or an empty list) is an address record,
 * anything else is an alias record.
 */
RecordType inferRecordType(const Targets&);

/**
 * Builds the one record for `hostname`.
 * Address records keep every target in order. Alias records keep exactly one target:
 * the first entry that is not an IP literal.
 */
Endpoint endpointForHostname(const std::string& hostname, const Targets& targets, TTL ttl, const ProviderSpecific& providerSpecific, const std::optional<std::string>& setIdentifier);

/// Writes `endpoints` as a JSON array, in order. `indent` < 0 means compact.
result<void, std::string> serialize(std::ostream&, const std::vector<Endpoint>& endpoints, int indent = -1);

}
