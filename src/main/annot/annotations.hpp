#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <util/result.hpp>
#include <endpoint/endpoint.hpp>
#include <engine/container.hpp>

namespace moordns::annot {

constexpr auto HOSTNAME_KEY = "external-dns.alpha.kubernetes.io/hostname";
constexpr auto TARGET_KEY = "external-dns.alpha.kubernetes.io/target";
constexpr auto TTL_KEY = "external-dns.alpha.kubernetes.io/ttl";
constexpr auto SET_IDENTIFIER_KEY = "external-dns.alpha.kubernetes.io/set-identifier";
constexpr auto CLOUDFLARE_PROXIED_KEY = "external-dns.alpha.kubernetes.io/cloudflare-proxied";
constexpr auto ALIAS_KEY = "external-dns.alpha.kubernetes.io/alias";
constexpr auto AWS_PREFIX = "external-dns.alpha.kubernetes.io/aws-";
constexpr auto SCW_PREFIX = "external-dns.alpha.kubernetes.io/scw-";

constexpr auto NETWORK_KEY = "external-dns/network";
constexpr auto COMPOSE_SERVICE_KEY = "com.docker.compose.service";
constexpr auto SWARM_SERVICE_ID_KEY = "com.docker.swarm.service.id";
constexpr auto SWARM_SERVICE_NAME_KEY = "com.docker.swarm.service.name";

constexpr TTL TTL_MAX = 2147483647;

struct ParseError {
	std::string key;
	std::string value;
	std::string desc;
	std::string to_string() const;
};

/// Names to publish, in annotation order. Empty: nothing to publish.
std::vector<std::string> hostnames(const LabelMap&);
/// Absent annotation → nullopt; malformed → ParseError
result<std::optional<TTL>, ParseError> ttl(const LabelMap&);
/// Explicit target override, trailing root dots stripped
Targets explicitTargets(const LabelMap&);

struct ProviderOptions {
	ProviderSpecific properties;
	std::optional<std::string> setIdentifier;
};
ProviderOptions providerSpecific(const LabelMap&);

std::optional<std::string> preferredNetwork(const LabelMap&);

/// Grouping keys. An empty label value counts as absent.
std::optional<std::string> composeService(const LabelMap&);
std::optional<std::string> swarmServiceId(const LabelMap&);
std::optional<std::string> swarmServiceName(const LabelMap&);

}
