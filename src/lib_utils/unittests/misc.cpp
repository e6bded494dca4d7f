#include "tests/tests.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/log.hpp"
#include "lib_utils/small_map.hpp"
#include "lib_utils/tools.hpp"

using namespace Tests;

namespace {

unittest("format: one argument") {
	ASSERT_EQUALS("45", format("%s", 45));
}

unittest("format: one uint8_t argument") {
	ASSERT_EQUALS("45", format("%s", (uint8_t)45));
}

unittest("format: one char argument") {
	ASSERT_EQUALS("A", format("%s", 'A'));
}

unittest("format: string argument") {
	std::string s = "Hello";
	ASSERT_EQUALS("Hello, world", format("%s, world", s));
}

unittest("format: vector argument") {
	std::vector<int> v { 1, 2, 3 };
	ASSERT_EQUALS("[1, 2, 3]", format("%s", v));
}

unittest("format: several arguments and percent") {
	ASSERT_EQUALS("prefix 'p' at 100%", format("prefix '%s' at %s%%", "p", 100));
	ASSERT_EQUALS("50%", format("50%%"));
}

unittest("SmallMap: insertion order") {
	SmallMap<std::string, int> m;
	m["z"] = 1;
	m["a"] = 2;
	m["z"] = 3;

	ASSERT_EQUALS(2u, m.size());
	std::vector<std::string> keys;
	for(auto& p : m)
		keys.push_back(p.key);
	ASSERT_EQUALS(std::vector<std::string>({ "z", "a" }), keys);
	ASSERT_EQUALS(3, m.at("z"));
	ASSERT(m.contains("a"));
	ASSERT(!m.contains("b"));
	ASSERT_THROWN(m.at("b"));
}

unittest("enforce") {
	enforce(true, "never");
	ASSERT_THROWN(enforce(false, "failure"));
	ASSERT(startsWith("xmlns:p", "xmlns:"));
	ASSERT(!startsWith("xml", "xmlns"));
}

struct LogCapture : LogSink {
	void send(Level level, const char* msg) override {
		lines.push_back(format("%s %s", levelName(level), msg));
	}
	std::vector<std::string> lines;
};

unittest("log: level filter") {
	LogCapture capture;
	capture.setLevel(Info);
	capture.log(Debug, "hidden");
	capture.log(Info, "shown");
	capture.log(Error, "shown too");
	capture.log(Quiet, "never");
	ASSERT_EQUALS(std::vector<std::string>({ "info shown", "error shown too" }), capture.lines);
}

unittest("log: global sink") {
	LogCapture capture;
	setGlobalLogSink(&capture);
	setGlobalLogLevel(Debug);
	ASSERT_EQUALS((int)Debug, (int)getGlobalLogLevel());
	g_Log->log(Debug, "message");
	setGlobalLogSink(nullptr);
	ASSERT_EQUALS(std::vector<std::string>({ "debug message" }), capture.lines);
}

unittest("log: parse level") {
	ASSERT_EQUALS((int)Error, (int)parseLogLevel("error"));
	ASSERT_EQUALS((int)Warning, (int)parseLogLevel("warning"));
	ASSERT_EQUALS((int)Info, (int)parseLogLevel("info"));
	ASSERT_EQUALS((int)Debug, (int)parseLogLevel("debug"));
	ASSERT_EQUALS((int)Quiet, (int)parseLogLevel("quiet"));
	ASSERT_THROWN(parseLogLevel("verbose"));
}

}
