#include "source.hpp"

#include <optional>
#include "aggregate.hpp"

namespace moordns {

void Subscribers::subscribe(Handler h){
	std::lock_guard lk(lock);
	handlers.push_back(std::move(h));
}

void Subscribers::notify() const {
	std::vector<Handler> hs;
	{
		std::lock_guard lk(lock);
		hs = handlers;
	}
	for(const auto& h : hs) h();
}

std::size_t Subscribers::size() const {
	std::lock_guard lk(lock);
	return handlers.size();
}

DockerEngineSource::DockerEngineSource(SRuntimeClient c, bool swarm, log::Sink s) : client(std::move(c)), swarmMode(swarm), sink(std::move(s)) {}

result<std::vector<Endpoint>, std::string> DockerEngineSource::endpoints(){
	std::optional<ServiceMap> services;
	if(swarmMode){
		auto svcr = client->listServices();
		if(auto err = svcr.err()) log::warn(sink, "listing swarm services: ", *err, ", swarm grouping disabled for this cycle");
		else services = std::move(*svcr.ok());
	}
	auto containersr = client->listContainers();
	if(auto err = containersr.err()) return "listing containers: " + *err;
	return endpointsFromContainers(*containersr.ok(), services ? &*services : nullptr, sink);
}

void DockerEngineSource::addEventHandler(std::function<void()> h){ subscribers.subscribe(std::move(h)); }

void DockerEngineSource::notifyChanged() const { subscribers.notify(); }

}
