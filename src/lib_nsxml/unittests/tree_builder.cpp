#include "tests/tests.hpp"
#include "lib_nsxml/tree_builder.hpp"
#include "lib_nsxml/serializer.hpp"

using namespace NsXml;

namespace {
bool parseOk(std::string const& text) {
	try {
		parseXml(text);
		return true;
	} catch(std::exception const &) {
		return false;
	}
}

// Compares the namespace URI of every element and attribute of two trees.
void checkSameNamespaces(Node const& a, Node const& b) {
	ASSERT(a.type == b.type);
	if(!a.isElement()) {
		ASSERT_EQUALS(a.text, b.text);
		return;
	}

	ASSERT_EQUALS(a.qname().toString(), b.qname().toString());
	ASSERT_EQUALS(a.scope->findUri(a.prefix), b.scope->findUri(b.prefix));
	ASSERT_EQUALS(a.scope->findUri(""), b.scope->findUri(""));

	ASSERT_EQUALS(a.attr.size(), b.attr.size());
	for(auto& attr : a.attr) {
		ASSERT(b.attr.contains(attr.key));
		ASSERT_EQUALS(attr.value, b.attr.at(attr.key));
		if(!attr.key.prefix.empty())
			ASSERT_EQUALS(a.scope->findUri(attr.key.prefix), b.scope->findUri(attr.key.prefix));
	}

	ASSERT_EQUALS(a.children.size(), b.children.size());
	for(size_t i = 0; i < a.children.size(); ++i)
		checkSameNamespaces(a.children[i], b.children[i]);
}

std::string reserialize(std::string const& text) {
	return serializeXml(parseXml(text));
}
}

unittest("tree builder: scopes") {
	auto a = parseXml("<a xmlns='urn:d' xmlns:p='urn:p' id='1'><p:b p:k='v'/></a>");

	ASSERT_EQUALS("a", a.name);
	ASSERT_EQUALS("", a.prefix);
	ASSERT_EQUALS(1u, a.attr.size());
	ASSERT_EQUALS("1", a.attr.at({ "", "id" }));
	ASSERT_EQUALS("urn:d", a.scope->findUri(""));
	ASSERT_EQUALS("urn:p", a.scope->findUri("p"));

	ASSERT_EQUALS(1u, a.children.size());
	auto& b = a.children[0];
	ASSERT_EQUALS("p", b.prefix);
	ASSERT_EQUALS("b", b.name);
	ASSERT_EQUALS("v", b.attr.at({ "p", "k" }));
	ASSERT(b.scope == a.scope);
}

unittest("tree builder: nested declarations extend the parent scope") {
	auto a = parseXml("<a xmlns:p='urn:p'><b xmlns:q='urn:q'/></a>");
	auto& b = a.children[0];
	ASSERT(b.scope->parent == a.scope);
	ASSERT_EQUALS("urn:p", b.scope->findUri("p"));
	ASSERT_EQUALS("urn:q", b.scope->findUri("q"));
	ASSERT(a.scope->findByPrefix("q") == nullptr);
}

unittest("tree builder: content nodes") {
	auto a = parseXml("<?xml version=\"1.0\"?><!-- prolog --><a>x &amp; y<![CDATA[<z>]]><!--c-->&nbsp;<?pi d?></a>");
	ASSERT_EQUALS(5u, a.children.size());
	ASSERT(a.children[0].type == Node::Type::Text);
	ASSERT_EQUALS("x & y", a.children[0].text);
	ASSERT(a.children[1].type == Node::Type::CData);
	ASSERT(a.children[2].type == Node::Type::Comment);
	ASSERT(a.children[3].type == Node::Type::EntityRef);
	ASSERT_EQUALS("nbsp", a.children[3].text);
	ASSERT(a.children[4].type == Node::Type::ProcInstr);
	ASSERT_EQUALS("pi", a.children[4].target);
}

unittest("tree builder: malformed documents") {
	ASSERT(parseOk("  <a/>\n"));
	ASSERT(parseOk("<xml:a xml:lang='en'/>"));

	ASSERT(!parseOk(""));
	ASSERT(!parseOk("<a>"));
	ASSERT(!parseOk("<a></b>"));
	ASSERT(!parseOk("<a/><b/>"));
	ASSERT(!parseOk("text<a/>"));
	ASSERT(!parseOk("<p:a/>"));
	ASSERT(!parseOk("<a p:k='v'/>"));
	ASSERT(!parseOk("<a xmlns:p=''/>"));
	ASSERT(!parseOk("<a></a></a>"));
}

unittest("tree builder: attributes expanding to the same name") {
	ASSERT(!parseOk("<a p:b='1' xmlns:p='x' q:b='1' xmlns:q='x'/>"));
	ASSERT(!parseOk("<a xmlns:p='x'><c xmlns:q='x' p:b='1' q:b='2'/></a>"));

	ASSERT(parseOk("<a p:b='1' xmlns:p='x' q:b='1' xmlns:q='y'/>"));
	ASSERT(parseOk("<a p:b='1' xmlns:p='x' q:c='1' xmlns:q='x'/>"));
	ASSERT(parseOk("<a xmlns='x' xmlns:p='x' b='1' p:b='2'/>"));
}

unittest("round trip: output equals canonical input") {
	auto const inputs = std::vector<std::string>({
		"<a xmlns=\"urn:x\"><b><c xmlns=\"\"/></b></a>",
		"<p:a xmlns:p=\"urn:1\"><p:b xmlns:p=\"urn:2\"><p:c xmlns:p=\"urn:1\"/></p:b><p:d/></p:a>",
		"<r xmlns=\"urn:d\" xmlns:p=\"urn:p\" k=\"v\"><p:x p:y=\"1\">text &amp; more</p:x></r>",
		"<r><p:x xmlns:p=\"urn:p\"/><p:y xmlns:p=\"urn:p\"/></r>",
	});
	for(auto& input : inputs)
		ASSERT_EQUALS(input, reserialize(input));
}

unittest("round trip: redundant declarations are dropped") {
	ASSERT_EQUALS("<a xmlns:p=\"urn:p\"><p:b/></a>", reserialize("<a xmlns:p='urn:p'><p:b xmlns:p='urn:p'/></a>"));
	ASSERT_EQUALS("<a xmlns=\"urn:x\"><b/></a>", reserialize("<a xmlns='urn:x'><b xmlns='urn:x'/></a>"));
	ASSERT_EQUALS("<a><b/></a>", reserialize("<a xmlns=''><b xmlns=''/></a>"));
}

unittest("round trip: same namespaces after parsing the output") {
	auto const input =
	    "<doc xmlns='urn:doc' xmlns:m='urn:meta'>"
	    "  <m:info m:version='2'><title>T</title></m:info>"
	    "  <body xmlns=''><p>plain</p><x:p xmlns:x='urn:x' x:a='1'><inner xmlns='urn:doc'/></x:p></body>"
	    "  <m:info xmlns:m='urn:meta2'><m:sub xmlns:m='urn:meta'/></m:info>"
	    "  <m:last/>"
	    "</doc>";

	auto const original = parseXml(input);
	auto const output = serializeXml(original);
	auto const reparsed = parseXml(output);
	checkSameNamespaces(original, reparsed);

	// output is stable
	ASSERT_EQUALS(output, serializeXml(reparsed));
}
