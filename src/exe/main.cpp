#include <config/config.hpp>
#include <engine/source.hpp>
#include <snapshot/snapshot.hpp>
#include <endpoint/endpoint.hpp>
#include <util/log.hpp>

#include <fstream>
#include <iostream>
#include <memory>

namespace moordns {

result<config::Config, std::string> parseArgs(int argc, char* args[], bool& dry){
	if(argc < 2) return std::string("No config file given!");
	std::string cfgfnam;
	if(argc == 2) cfgfnam = args[1];
	else {
		if(argc > 3) std::cerr << "WARN: ignoring superflous arguments\n";
		if(std::string(args[1]) == "-t") dry = true;
		else return std::string("Unknown switch");
		cfgfnam = args[2];
	}
	std::ifstream cfgf(cfgfnam);
	if(cfgf.fail()) return std::string("Couldn't read config file");
	return config::parse(cfgf);
}

int main(int argc, char* args[]){
	bool dry = false;
	auto par = parseArgs(argc, args, dry);
	if(auto err = par.err()){
		std::cerr << *err << "\n";
		return 1;
	}
	auto config = *par.ok();
	if(dry) return 0;
	auto sink = log::toStream(std::cerr, config.logLevel);
	auto client = std::make_shared<snapshot::SnapshotClient>(config.snapshot.containers, config.snapshot.services);
	DockerEngineSource source(client, config.swarmMode, sink);
	auto eps = source.endpoints();
	if(auto err = eps.err()){
		log::error(sink, *err);
		return 1;
	}
	log::info(sink, eps.ok()->size(), " endpoint(s) resolved");
	if(auto err = serialize(std::cout, *eps.ok(), 2).err()){
		log::error(sink, "writing endpoints: ", *err);
		return 1;
	}
	std::cout << "\n";
	return 0;
}

}

int main(int argc, char* args[]){
	return moordns::main(argc, args);
}
