#include "aggregate.hpp"

#include <iterator>
#include <numeric>
#include <annot/annotations.hpp>
#include <util/ordmap.hpp>
#include "netres.hpp"

namespace moordns {

using Group = std::vector<PendingState>;

PendingState mergeGroup(const std::vector<PendingState>& members){
	return std::accumulate(std::next(members.begin()), members.end(), members.front(), [](PendingState rep, const PendingState& sibling){
		// fallback targets are the sibling's own address, never a duplicate
		if(sibling.hasFallbackTarget) rep.targets.insert(rep.targets.end(), sibling.targets.begin(), sibling.targets.end());
		return rep;
	});
}

static void emit(std::vector<Endpoint>& out, const PendingState& st){
	for(const auto& hostname : annot::hostnames(st.labels))
		out.push_back(endpointForHostname(hostname, st.targets, st.ttl, st.providerSpecific, st.setIdentifier));
}

std::vector<Endpoint> endpointsFromContainers(const std::vector<Container>& containers, const ServiceMap* swarmServices, const log::Sink& sink){
	std::vector<Endpoint> endpoints;
	OrderedMap<std::string, Group> composeGroups;
	OrderedMap<std::string, Group> swarmGroups;

	for(const auto& container : containers){
		auto ttlr = annot::ttl(container.labels);
		if(auto err = ttlr.err()){
			log::warn(sink, "skipping container ", container.displayName(), ": ", err->to_string());
			continue;
		}

		PendingState st;
		st.ttl = ttlr.ok()->value_or(0);
		st.targets = annot::explicitTargets(container.labels);
		if(st.targets.empty()){
			st.targets = resolveNetworkTarget(container.networks, annot::preferredNetwork(container.labels));
			st.hasFallbackTarget = !st.targets.empty();
		}
		if(st.targets.empty()) continue;
		auto opts = annot::providerSpecific(container.labels);
		st.providerSpecific = std::move(opts.properties);
		st.setIdentifier = std::move(opts.setIdentifier);
		st.labels = container.labels;

		auto swarmId = annot::swarmServiceId(container.labels);
		if(swarmId && swarmServices){
			swarmGroups[*swarmId].push_back(std::move(st));
			continue;
		}
		if(auto service = annot::composeService(container.labels)){
			composeGroups[*service].push_back(std::move(st));
			continue;
		}
		emit(endpoints, st);
	}

	for(const auto& group : composeGroups) emit(endpoints, mergeGroup(group.second));
	for(const auto& group : swarmGroups){
		if(swarmServices->count(group.first) == 0) continue;
		emit(endpoints, mergeGroup(group.second));
	}
	return endpoints;
}

}
