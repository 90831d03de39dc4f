#pragma once

// https://stackoverflow.com/a/217605

#include <string>
#include <vector>
#include <algorithm>
#include <cctype>

namespace moordns {

/// trim from start (in place)
inline void ltrim(std::string &s) {
	s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
		return !std::isspace(ch);
	}));
}

/// trim from end (in place)
inline void rtrim(std::string &s) {
	s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) {
		return !std::isspace(ch);
	}).base(), s.end());
}

/// trim from both ends (in place)
inline void trim(std::string &s) {
	ltrim(s);
	rtrim(s);
}

/// checks if a string begins with a prefix
inline bool beginsWith(const std::string& s, const std::string& pref){ return s.rfind(pref, 0) == 0; }

/// checks if a string ends with a suffix
inline bool endsWith(const std::string& s, const std::string& suff){
	return s.length() >= suff.length() && s.compare(s.length() - suff.length(), suff.length(), suff) == 0;
}

/**
 * Splits `s` on every `sep`, trimming each piece.
 * Pieces that are empty after trimming are dropped.
 */
inline std::vector<std::string> splitTrimmed(const std::string& s, char sep){
	std::vector<std::string> pieces;
	std::size_t from = 0;
	while(from <= s.length()){
		auto to = s.find(sep, from);
		if(to == std::string::npos) to = s.length();
		auto piece = s.substr(from, to - from);
		trim(piece);
		if(!piece.empty()) pieces.push_back(std::move(piece));
		from = to + 1;
	}
	return pieces;
}

}
