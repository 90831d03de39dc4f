#pragma once

#include <string>
#include <optional>
#include <iostream>
#include <util/result.hpp>
#include <util/log.hpp>

namespace moordns::config {

struct Snapshot {
	/// Container list file (runtime `GET /containers/json` output)
	std::string containers;
	/// Service list file (runtime `GET /services` output)
	std::optional<std::string> services;
};

struct Config {
	/// Group swarm service tasks by service id
	bool swarmMode = false;
	log::Level logLevel = log::Level::Warn;
	Snapshot snapshot;
};

result<Config, std::string> parse(std::istream&);
result<void, std::string> serialize(std::ostream&, const Config&);

}
