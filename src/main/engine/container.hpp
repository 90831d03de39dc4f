#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace moordns {

using LabelMap = std::unordered_map<std::string, std::string>;

struct NetworkAttachment {
	std::string ipAddress;
	std::string gateway;
};

/// Network name → attachment
using NetworkMap = std::unordered_map<std::string, NetworkAttachment>;

/**
 * What the runtime reports about one running container.
 * Only labels and networks drive resolution; id and names show up in log messages.
 */
struct Container {
	std::string id;
	std::vector<std::string> names;
	LabelMap labels;
	NetworkMap networks;
	/// first name, or short id if unnamed
	std::string displayName() const;
};

struct ServicePort {
	std::string protocol;
	unsigned targetPort = 0;
	unsigned publishedPort = 0;
	std::string publishMode;
};

struct ServiceVirtualIP {
	std::string networkId;
	std::string addr;
};

/**
 * Cluster-managed service as listed by the orchestrator.
 * Resolution only checks that one exists for a given id.
 */
struct ServiceDescriptor {
	std::string id;
	std::string name;
	/// endpoint resolution mode (`vip` / `dnsrr`)
	std::string mode;
	std::vector<ServicePort> ports;
	std::vector<ServiceVirtualIP> virtualIPs;
};

/// Service id → descriptor
using ServiceMap = std::unordered_map<std::string, ServiceDescriptor>;

}
