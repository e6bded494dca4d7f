#pragma once

#include <memory>
#include <string>
#include <stdexcept> //runtime_error

using std::make_unique;
using std::make_shared;

inline
void enforce(bool condition, const char* msg) {
	if (!condition)
		throw std::runtime_error(msg);
}

inline
void enforce(bool condition, std::string const& msg) {
	if (!condition)
		throw std::runtime_error(msg);
}

inline
bool startsWith(std::string const& s, std::string const& prefix) {
	return s.compare(0, prefix.size(), prefix) == 0;
}
