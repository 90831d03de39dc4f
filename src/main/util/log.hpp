#pragma once

#include <functional>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>

namespace moordns::log {

enum class Level {
	Debug, Info, Warn, Error
};

/// Receives every message the core reports. Filtering is the sink's business.
using Sink = std::function<void(Level, const std::string&)>;

/// Sink printing `LEVEL: message` lines of at least `min` severity onto `os`
Sink toStream(std::ostream& os, Level min = Level::Warn);
/// Sink that drops everything
Sink discard();

const char* levelName(Level);
std::optional<Level> levelFromName(const std::string&);

template<typename... Args> void write(const Sink& sink, Level lvl, const Args&... args){
	if(!sink) return;
	std::ostringstream msg;
	(msg << ... << args);
	sink(lvl, msg.str());
}

template<typename... Args> void info(const Sink& sink, const Args&... args){ write(sink, Level::Info, args...); }
template<typename... Args> void warn(const Sink& sink, const Args&... args){ write(sink, Level::Warn, args...); }
template<typename... Args> void error(const Sink& sink, const Args&... args){ write(sink, Level::Error, args...); }

}
