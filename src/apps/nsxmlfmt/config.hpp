#pragma once

#include <string>

struct Config {
	std::string inputPath;
	std::string outputPath;
	std::string encoding = "UTF-8";
	std::string logLevel;
	bool declaration = false;
	bool syslog = false;
	bool noColor = false;
	bool help = false;
};
