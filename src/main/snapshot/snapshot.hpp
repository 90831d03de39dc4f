#pragma once

#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <engine/source.hpp>

namespace moordns::snapshot {

/// Parses a container list as returned by the runtime's `GET /containers/json`
result<std::vector<Container>, std::string> parseContainers(std::istream&);
/// Parses a service list as returned by the runtime's `GET /services`
result<ServiceMap, std::string> parseServices(std::istream&);

/**
 * Runtime client answering from JSON files captured off the runtime API.
 * Files are re-read on every call.
 */
class SnapshotClient : public IRuntimeClient {
	std::string containersFile;
	std::optional<std::string> servicesFile;
	public:
		SnapshotClient(std::string containersFile, std::optional<std::string> servicesFile);
		result<std::vector<Container>, std::string> listContainers() override;
		/// No services file is an empty service list
		result<ServiceMap, std::string> listServices() override;
};

}
