#include "lib_appcommon/options.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/log.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include "config.hpp"
#include "reformat.hpp"

using namespace std;

const char *g_appName = "nsxmlfmt";
const char *g_version = "1.0";

namespace {
Config parseCommandLine(int argc, char const* argv[]) {

	Config cfg;

	CmdLineOptions opt;
	opt.addFlag("h", "help", &cfg.help, "Print usage and exit.");
	opt.add("o", "output", &cfg.outputPath, "Output file path (default: standard output)");
	opt.add("e", "encoding", &cfg.encoding, "Output character encoding (default: UTF-8)");
	opt.addFlag("d", "declaration", &cfg.declaration, "Write the XML declaration");
	opt.add("l", "log-level", &cfg.logLevel, "Log level: quiet, error, warning, info, debug");
	opt.addFlag("s", "syslog", &cfg.syslog, "Send logs to syslog");
	opt.addFlag("n", "no-color", &cfg.noColor, "Disable console log colors");

	auto files = opt.parse(argc, argv);

	if(cfg.help) {
		cout << g_appName << " " << g_version << endl;
		cout << "Usage: " << g_appName << " [options] <input.xml|->" << endl;
		cout << "Re-serializes an XML document, declaring each namespace binding once." << endl;
		cout << "Options:" << endl;
		opt.printHelp(cout);
		return cfg;
	}

	if (files.size() != 1)
		throw std::runtime_error("invalid command line, use --help");

	cfg.inputPath = files[0];

	return cfg;
}

std::string readInput(std::string const& path) {
	std::stringstream ss;
	if(path == "-") {
		ss << cin.rdbuf();
	} else {
		std::ifstream file(path, std::ios::binary);
		if(!file)
			throw std::runtime_error(format("Can't open '%s' for reading", path));
		ss << file.rdbuf();
	}
	return ss.str();
}

void setupLogs(Config const& cfg) {
	if(cfg.syslog)
		setGlobalLogSyslog(g_appName, "nsxml");
	else if(cfg.noColor)
		setGlobalLogConsole(false);

	if(!cfg.logLevel.empty())
		setGlobalLogLevel(parseLogLevel(cfg.logLevel.c_str()));
}
}

int safeMain(int argc, char const* argv[]) {
	auto const cfg = parseCommandLine(argc, argv);
	if(cfg.help)
		return 0;

	setupLogs(cfg);

	auto const input = readInput(cfg.inputPath);
	g_Log->log(Info, format("[%s] read %s bytes from '%s'", g_appName, input.size(), cfg.inputPath).c_str());

	reformat(cfg, input, cout);

	return 0;
}

int main(int argc, char const* argv[]) {
	try {
		return safeMain(argc, argv);
	} catch(std::exception const& e) {
		fprintf(stderr, "[%s] Error: %s\n", g_appName, e.what());
		return 1;
	}
}
