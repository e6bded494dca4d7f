#include "tests/tests.hpp"
#include "apps/nsxmlfmt/reformat.hpp"
#include <cstdio> // remove
#include <fstream>
#include <sstream>

namespace {
std::string run(Config const& cfg, std::string const& input) {
	std::stringstream out;
	reformat(cfg, input, out);
	return out.str();
}
}

unittest("nsxmlfmt: standard output ends with a newline") {
	Config cfg;
	ASSERT_EQUALS("<p:a xmlns:p=\"urn:p\"><p:b/></p:a>\n", run(cfg, "<p:a xmlns:p='urn:p'><p:b xmlns:p='urn:p'/></p:a>"));
}

unittest("nsxmlfmt: standard output is entirely in the output encoding") {
	Config cfg;
	cfg.encoding = "UTF-16LE";
	auto const out = run(cfg, "<a/>");
	ASSERT_EQUALS(std::string("<\0a\0/\0>\0\n\0", 10), out);
	ASSERT_EQUALS(0u, out.size() % 2);
}

unittest("nsxmlfmt: declaration") {
	Config cfg;
	cfg.declaration = true;
	ASSERT_EQUALS("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?><a/>\n", run(cfg, "<a/>"));
}

unittest("nsxmlfmt: file output") {
	Config cfg;
	cfg.outputPath = "nsxmlfmt_reformat.xml";
	cfg.encoding = "UTF-16LE";
	ASSERT_EQUALS("", run(cfg, "<a/>"));

	std::ifstream file(cfg.outputPath, std::ios::binary);
	std::stringstream ss;
	ss << file.rdbuf();
	file.close();
	std::remove(cfg.outputPath.c_str());
	ASSERT_EQUALS(std::string("<\0a\0/\0>\0", 8), ss.str());
}

unittest("nsxmlfmt: malformed input") {
	Config cfg;
	std::stringstream out;
	ASSERT_THROWN(reformat(cfg, "<a>", out));
	ASSERT_EQUALS("", out.str());
}
