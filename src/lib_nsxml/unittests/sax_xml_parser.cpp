#include "tests/tests.hpp"
#include "lib_nsxml/sax_xml_parser.hpp"
#include <cctype>

using namespace NsXml;

static const char xmlTestData[] = R"(<?xml version="1.0" encoding="utf-8"?>
<!DOCTYPE svg PUBLIC "-//W3C//DTD SVG 1.1//EN" "http://www.w3.org/Graphics/SVG/1.1/DTD/svg11.dtd" [ <!ENTITY logo "L"> ]>
<!-- This is a comment -->
<svg xmlns="http://www.w3.org/2000/svg" xmlns:xl="http://www.w3.org/1999/xlink" width='10'>
   <title>Test &amp; demo</title>
   <use xl:href="#a"/>
   <![CDATA[<raw>]]>
   <?render fast?>
   <desc>&logo;</desc>
</svg>
)";

namespace {
struct Recorder : SaxHandler {
	void onNodeStart(std::string const& name, SmallMap<std::string, std::string> const& attributes) override {
		std::string s = "start " + name;
		for(auto& a : attributes)
			s += " " + a.key + "=" + a.value;
		events.push_back(s);
	}
	void onNodeEnd(std::string const& name) override {
		events.push_back("end " + name);
	}
	void onText(std::string const& content) override {
		bool blank = true;
		for(auto c : content)
			if(!isspace((unsigned char)c))
				blank = false;
		if(!blank)
			events.push_back("text " + content);
	}
	void onEntityRef(std::string const& name) override {
		events.push_back("entity " + name);
	}
	void onCData(std::string const& content) override {
		events.push_back("cdata " + content);
	}
	void onComment(std::string const& content) override {
		events.push_back("comment" + content);
	}
	void onProcInstr(std::string const& target, std::string const& data) override {
		events.push_back("pi " + target + " " + data);
	}
	std::vector<std::string> events;
};

bool parseOk(std::string const& text) {
	Recorder r;
	try {
		saxParse(toSpan(text), r);
		return true;
	} catch(std::exception const &) {
		return false;
	}
}
}

unittest("SAX XML parser: events") {
	Recorder r;
	saxParse(span<const char>(xmlTestData, sizeof(xmlTestData) - 1), r);

	auto expected = std::vector<std::string>({
		"comment This is a comment ",
		"start svg xmlns=http://www.w3.org/2000/svg xmlns:xl=http://www.w3.org/1999/xlink width=10",
		"start title",
		"text Test & demo",
		"end title",
		"start use xl:href=#a",
		"end use",
		"cdata <raw>",
		"pi render fast",
		"start desc",
		"entity logo",
		"end desc",
		"end svg",
	});
	ASSERT_EQUALS(expected, r.events);
}

unittest("SAX XML parser: character references") {
	Recorder r;
	saxParse(toSpan("<a t=\"&lt;&#65;&#x42;&quot;\">&#xE9;&apos;</a>"), r);
	ASSERT_EQUALS(std::vector<std::string>({ "start a t=<AB\"", "text \xC3\xA9'", "end a" }), r.events);
}

unittest("SAX XML parser: malformed input") {
	ASSERT(parseOk("<a/>"));
	ASSERT(parseOk("<a b='1' c=\"2\" ></a >"));

	ASSERT(!parseOk("<a"));
	ASSERT(!parseOk("<a b=1/>"));
	ASSERT(!parseOk("<a b='1' b='2'/>"));
	ASSERT(!parseOk("<a b='<'/>"));
	ASSERT(!parseOk("<a b='&nbsp;'/>"));
	ASSERT(!parseOk("<a><!-- unterminated </a>"));
	ASSERT(!parseOk("<a>&#xZZ;</a>"));
	ASSERT(!parseOk("<a>& b</a>"));
	ASSERT(!parseOk("</>"));
}

unittest("SAX XML parser: character references outside the XML character range") {
	ASSERT(parseOk("<a>&#x9;&#xA;&#xD;&#xD7FF;&#xE000;&#xFFFD;&#x10000;&#x10FFFF;</a>"));

	ASSERT(!parseOk("<a>&#0;</a>"));
	ASSERT(!parseOk("<a>&#x1;</a>"));
	ASSERT(!parseOk("<a>&#xD800;</a>"));
	ASSERT(!parseOk("<a>&#xDFFF;</a>"));
	ASSERT(!parseOk("<a>&#xFFFE;</a>"));
	ASSERT(!parseOk("<a>&#x110000;</a>"));
	ASSERT(!parseOk("<a b='&#0;'/>"));
}
