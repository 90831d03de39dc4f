#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <endpoint/endpoint.hpp>
#include <util/log.hpp>
#include <util/result.hpp>
#include "container.hpp"

namespace moordns {

/**
 * Connection to the container runtime.
 * Every call returns a fresh, independent snapshot.
 */
class IRuntimeClient {
	public:
		virtual ~IRuntimeClient() = default;
		virtual result<std::vector<Container>, std::string> listContainers() = 0;
		virtual result<ServiceMap, std::string> listServices() = 0;
};

using SRuntimeClient = std::shared_ptr<IRuntimeClient>;

/// Append-only list of change handlers
class Subscribers {
	using Handler = std::function<void()>;
	mutable std::mutex lock;
	std::vector<Handler> handlers;
	public:
		void subscribe(Handler);
		/// Runs every handler on the calling thread, in subscription order
		void notify() const;
		std::size_t size() const;
};

/**
 * Produces the endpoint records for the current state of a container runtime.
 */
class DockerEngineSource {
	SRuntimeClient client;
	bool swarmMode;
	log::Sink sink;
	Subscribers subscribers;
	public:
		DockerEngineSource(SRuntimeClient, bool swarmMode, log::Sink);
		/**
		 * Runs one resolution cycle.
		 * Failing to list containers fails the cycle.
		 * Failing to list swarm services only disables swarm grouping for this cycle.
		 */
		result<std::vector<Endpoint>, std::string> endpoints();
		/// Handler is called whenever the runtime's state is known to have changed
		void addEventHandler(std::function<void()>);
		/// Signals the registered handlers; called by whatever watches the runtime
		void notifyChanged() const;
};

}
