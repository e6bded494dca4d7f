#pragma once

#include <string>
#include <cstdio>
#include <cstdint>
#include <vector>
#include <stdexcept>

// printf-like formatting where every placeholder is "%s", whatever the argument type.
struct Local {
	template<typename T>
	static std::string to_string(const std::vector<T>& val) {
		std::string ss;
		ss += "[";
		for (size_t i = 0; i < val.size(); ++i) {
			if (i > 0)
				ss += ", ";
			ss += Local::to_string(val[i]);
		}
		ss += "]";
		return ss;
	}
	static std::string to_string(const char& c) {
		std::string s;
		return s + c;
	}
	static std::string to_string(const char* v) {
		return v;
	}
	static std::string to_string(char* v) {
		return v;
	}
	static std::string to_string(const std::string& v) {
		return v;
	}
	static std::string to_string(bool v) {
		return v ? "true" : "false";
	}
	static std::string to_string(uint8_t v) {
		return to_string((unsigned)v);
	}
	static std::string to_string(double v) {
		char buffer[128];
		snprintf(buffer, sizeof buffer, "%f", v);
		return buffer;
	}
	static std::string to_string(long unsigned v) {
		char buffer[128];
		snprintf(buffer, sizeof buffer, "%lu", v);
		return buffer;
	}
	static std::string to_string(long v) {
		char buffer[128];
		snprintf(buffer, sizeof buffer, "%ld", v);
		return buffer;
	}
	static std::string to_string(unsigned int v) {
		char buffer[128];
		snprintf(buffer, sizeof buffer, "%u", v);
		return buffer;
	}
	static std::string to_string(int v) {
		char buffer[128];
		snprintf(buffer, sizeof buffer, "%d", v);
		return buffer;
	}
	static std::string to_string(long long v) {
		char buffer[128];
		snprintf(buffer, sizeof buffer, "%lld", v);
		return buffer;
	}
	static std::string to_string(unsigned long long v) {
		char buffer[128];
		snprintf(buffer, sizeof buffer, "%llu", v);
		return buffer;
	}
};

inline std::string format(const std::string& fmt) {
	std::string r;
	for (size_t i = 0; i < fmt.size(); ++i) {
		if (fmt[i] == '%' && i + 1 < fmt.size() && fmt[i + 1] == '%')
			++i;
		r += fmt[i];
	}
	return r;
}

template<typename T, typename... Arguments>
std::string format(const std::string& fmt, const T& firstArg, Arguments... args) {
	std::string r;
	size_t i = 0;
	while (i < fmt.size()) {
		if (fmt[i] == '%') {
			++i;
			if (i >= fmt.size())
				throw std::runtime_error("Invalid format specifier");

			if (fmt[i] == '%')
				r += '%';
			else if (fmt[i] == 's') {
				r += Local::to_string(firstArg);
				return r + format(fmt.substr(i + 1), args...);
			}
		} else {
			r += fmt[i];
		}
		++i;
	}
	return r;
}
