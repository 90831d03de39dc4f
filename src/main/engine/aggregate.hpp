#pragma once

#include <optional>
#include <string>
#include <vector>
#include <endpoint/endpoint.hpp>
#include <util/log.hpp>
#include "container.hpp"

namespace moordns {

/// One container's contribution to a group, alive for a single resolution pass
struct PendingState {
	TTL ttl = 0;
	Targets targets;
	ProviderSpecific providerSpecific;
	std::optional<std::string> setIdentifier;
	/// targets were taken from the network attachments, not from the target label
	bool hasFallbackTarget = false;
	LabelMap labels;
};

/**
 * Folds a group into its representative: the first member, with the targets of every
 * later network-fallback member appended in member order.
 * `members` must not be empty.
 */
PendingState mergeGroup(const std::vector<PendingState>& members);

/**
 * Turns one snapshot of containers into endpoint records.
 *
 * Pure: depends only on its arguments, output order follows the container scan order
 * (standalone records first, then compose groups, then swarm groups, each in order of first appearance).
 *
 * @param containers the snapshot, in the runtime's listing order
 * @param swarmServices known swarm services; null when not running in swarm mode, which disables swarm grouping
 * @param sink receives a warning for each container skipped on malformed labels
 */
std::vector<Endpoint> endpointsFromContainers(const std::vector<Container>& containers, const ServiceMap* swarmServices, const log::Sink& sink);

}
