#include "log.hpp"

#include <mutex>

namespace moordns::log {

const char* levelName(Level lvl){
	switch(lvl){
		case Level::Debug: return "debug";
		case Level::Info: return "info";
		case Level::Warn: return "warn";
		case Level::Error: return "error";
		default: return "unknown";
	}
}

std::optional<Level> levelFromName(const std::string& name){
	if(name == "debug") return Level::Debug;
	if(name == "info") return Level::Info;
	if(name == "warn") return Level::Warn;
	if(name == "error") return Level::Error;
	return std::nullopt;
}

static const char* levelTag(Level lvl){
	switch(lvl){
		case Level::Debug: return "DEBUG";
		case Level::Info: return "INFO";
		case Level::Warn: return "WARN";
		case Level::Error: return "ERROR";
		default: return "?";
	}
}

Sink toStream(std::ostream& os, Level min){
	return [&os, min](Level lvl, const std::string& msg){
		if(lvl < min) return;
		static std::mutex outlock;
		std::lock_guard lock(outlock);
		os << levelTag(lvl) << ": " << msg << "\n";
	};
}

Sink discard(){
	return [](Level, const std::string&){};
}

}
