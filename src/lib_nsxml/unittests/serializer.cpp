#include "tests/tests.hpp"
#include "lib_nsxml/serializer.hpp"
#include "lib_utils/log.hpp"
#include <stdexcept>

using namespace NsXml;

namespace {
struct LogCapture : LogSink {
	void send(Level level, const char* msg) override {
		messages.push_back(std::string(levelName(level)) + ": " + msg);
	}
	std::vector<std::string> messages;
};

// Fails on the n-th write.
struct FailingWriter : IWriter {
	FailingWriter(int n) : remaining(n) {
	}
	void write(std::string const& text) override {
		if(--remaining <= 0)
			throw std::runtime_error("disk full");
		out += text;
	}
	int remaining;
	std::string out;
};
}

unittest("serializer: default namespace, inherited then reset") {
	auto scopeA = bindDefault("urn:x");
	auto a = element("a", scopeA);
	auto b = element("b", bindDefault("urn:x", scopeA));
	b.add(element("c", bindDefault("", b.scope)));
	a.add(b);

	ASSERT_EQUALS("<a xmlns=\"urn:x\"><b><c xmlns=\"\"/></b></a>", serializeXml(a));
}

unittest("serializer: prefixed element with attribute") {
	auto e = element("p", "name", bindPrefix("p", "urn:p"));
	e["id"] = "1";
	ASSERT_EQUALS("<p:name xmlns:p=\"urn:p\" id=\"1\"/>", serializeXml(e));
}

unittest("serializer: no redundant declaration") {
	auto scope = bindPrefix("p", "urn:p");
	auto a = element("p", "a", scope);
	a.add(element("p", "b", scope));
	ASSERT_EQUALS("<p:a xmlns:p=\"urn:p\"><p:b/></p:a>", serializeXml(a));
}

unittest("serializer: declaration made several levels up is reused") {
	auto scope = bindPrefix("p", "urn:p");
	auto a = element("p", "a", scope);
	auto b = element("b", scope);
	auto c = element("c", scope);
	c.add(element("p", "d", scope));
	b.add(c);
	a.add(b);
	ASSERT_EQUALS("<p:a xmlns:p=\"urn:p\"><b><c><p:d/></c></b></p:a>", serializeXml(a));
}

unittest("serializer: identical bindings from distinct chains are not repeated") {
	auto a = element("p", "a", bindPrefix("p", "urn:p"));
	a.add(element("p", "b", bindPrefix("p", "urn:p")));
	ASSERT_EQUALS("<p:a xmlns:p=\"urn:p\"><p:b/></p:a>", serializeXml(a));
}

unittest("serializer: sibling isolation") {
	auto r = element("r");
	auto x = element("p", "x", bindPrefix("p", "urn:p"));
	x.add(element("p", "inner", x.scope));
	r.add(x);
	r.add(element("p", "y", bindPrefix("p", "urn:p")));
	ASSERT_EQUALS("<r><p:x xmlns:p=\"urn:p\"><p:inner/></p:x><p:y xmlns:p=\"urn:p\"/></r>", serializeXml(r));
}

unittest("serializer: rebound prefix is always declared again") {
	auto s1 = bindPrefix("p", "urn:1");
	auto s2 = bindPrefix("p", "urn:2", s1);
	auto s3 = bindPrefix("p", "urn:1", s2);

	auto a = element("p", "a", s1);
	auto b = element("p", "b", s2);
	b.add(element("p", "c", s3));
	a.add(b);
	a.add(element("p", "d", s1));

	ASSERT_EQUALS(
	    "<p:a xmlns:p=\"urn:1\">"
	    "<p:b xmlns:p=\"urn:2\"><p:c xmlns:p=\"urn:1\"/></p:b>"
	    "<p:d/>"
	    "</p:a>", serializeXml(a));
}

unittest("serializer: only the effective binding of a prefix is declared") {
	auto scope = bindPrefix("p", "urn:2", bindPrefix("p", "urn:1"));
	ASSERT_EQUALS("<p:a xmlns:p=\"urn:2\"/>", serializeXml(element("p", "a", scope)));
}

unittest("serializer: default namespace toggling") {
	auto scopeA = bindDefault("urn:A");
	auto a = element("a", scopeA);
	a.add(element("b", scopeA));
	a.add(element("c", bindDefault("urn:B", scopeA)));
	a.add(element("d", emptyScope()));
	a.add(element("e", scopeA));
	ASSERT_EQUALS("<a xmlns=\"urn:A\"><b/><c xmlns=\"urn:B\"/><d xmlns=\"\"/><e/></a>", serializeXml(a));
}

unittest("serializer: no namespace at all") {
	auto a = element("a");
	a.add(element("b"));
	ASSERT_EQUALS("<a><b/></a>", serializeXml(a));
}

unittest("serializer: prefixed element keeps the default namespace") {
	auto scopeA = bindDefault("urn:A");
	auto a = element("a", scopeA);
	auto b = element("p", "b", bindPrefix("p", "urn:p", scopeA));
	b.add(element("c", b.scope));
	b.add(element("d", emptyScope()));
	a.add(b);
	ASSERT_EQUALS("<a xmlns=\"urn:A\"><p:b xmlns:p=\"urn:p\"><c/><d xmlns=\"\"/></p:b></a>", serializeXml(a));
}

unittest("serializer: default namespace set below a reset") {
	auto a = element("a", bindDefault("urn:A"));
	auto b = element("b", emptyScope());
	b.add(element("c", bindDefault("urn:A")));
	a.add(b);
	ASSERT_EQUALS("<a xmlns=\"urn:A\"><b xmlns=\"\"><c xmlns=\"urn:A\"/></b></a>", serializeXml(a));
}

unittest("serializer: attribute order preserved") {
	auto e = element("e");
	e["z"] = "1";
	e["a"] = "2";
	e["m"] = "3";
	ASSERT_EQUALS("<e z=\"1\" a=\"2\" m=\"3\"/>", serializeXml(e));
}

unittest("serializer: prefixed attribute") {
	auto e = element("use", bindPrefix("xl", "urn:xlink"));
	e.attr[{ "xl", "href" }] = "#a";
	ASSERT_EQUALS("<use xmlns:xl=\"urn:xlink\" xl:href=\"#a\"/>", serializeXml(e));
}

unittest("serializer: declaration order") {
	auto scope = bindPrefix("b", "urn:b", bindPrefix("a", "urn:a"));
	ASSERT_EQUALS("<r xmlns:a=\"urn:a\" xmlns:b=\"urn:b\"/>", serializeXml(element("r", scope)));
}

unittest("serializer: opening tag layout") {
	auto e = element("r", bindPrefix("p", "urn:p", bindDefault("urn:d")));
	e["k"] = "v";
	ASSERT_EQUALS("<r xmlns=\"urn:d\" xmlns:p=\"urn:p\" k=\"v\"/>", serializeXml(e));
}

unittest("serializer: escaped values") {
	auto e = element("r", bindPrefix("p", "urn:a&b"));
	e["title"] = "say \"hi\"";
	e["expr"] = "a<b";
	ASSERT_EQUALS("<r xmlns:p=\"urn:a&amp;b\" title='say \"hi\"' expr=\"a&lt;b\"/>", serializeXml(e));
}

unittest("serializer: self-closing only without children") {
	ASSERT_EQUALS("<t/>", serializeXml(element("t")));

	auto withEmptyText = element("t");
	withEmptyText.add(text(""));
	ASSERT_EQUALS("<t></t>", serializeXml(withEmptyText));
}

unittest("serializer: non-element children") {
	auto r = element("r");
	r.add(text("a<b"));
	r.add(cdata("x<y"));
	r.add(comment(" c "));
	r.add(entityRef("nbsp"));
	r.add(procInstr("pi", "data"));
	ASSERT_EQUALS("<r>a&lt;b<![CDATA[x<y]]><!-- c -->&nbsp;<?pi data?></r>", serializeXml(r));
}

unittest("serializer: unbound prefix is written unqualified") {
	LogCapture capture;
	setGlobalLogSink(&capture);

	auto r = element("r", bindDefault("urn:d"));
	r.add(element("q", "x", emptyScope()));
	auto const out = serializeXml(r);

	setGlobalLogSink(nullptr);

	ASSERT_EQUALS("<r xmlns=\"urn:d\"><x xmlns=\"\"/></r>", out);
	ASSERT_EQUALS(1u, capture.messages.size());
}

unittest("serializer: root must be an element") {
	ASSERT_THROWN(serializeXml(text("hello")));
}

unittest("serializer: writer errors propagate") {
	auto r = element("r");
	r.add(element("a"));
	r.add(element("b"));

	FailingWriter w(3);
	ASSERT_THROWN(serialize(r, w));
	ASSERT_EQUALS("<r><a/>", w.out);

	// state doesn't leak into the next call
	std::string out;
	StringWriter sw(out);
	serialize(r, sw);
	ASSERT_EQUALS("<r><a/><b/></r>", out);
}

unittest("serializer: tree is left untouched") {
	auto scope = bindPrefix("p", "urn:p");
	auto r = element("p", "r", scope);
	r.add(element("p", "c", scope));
	auto const first = serializeXml(r);
	ASSERT_EQUALS(first, serializeXml(r));
	ASSERT(r.scope == scope);
	ASSERT_EQUALS(1u, r.scope->depth());
}

unittest("serializer: fragments appended to the same writer") {
	std::string out;
	StringWriter w(out);
	auto e = element("p", "e", bindPrefix("p", "urn:p"));
	serialize(e, w);
	serialize(e, w);
	ASSERT_EQUALS("<p:e xmlns:p=\"urn:p\"/><p:e xmlns:p=\"urn:p\"/>", out);
}

unittest("serializer: deep tree") {
	int const depth = 2000;
	auto scope = bindPrefix("p", "urn:p");
	auto leaf = element("p", "n", scope);
	for(int i = 1; i < depth; ++i) {
		auto parent = element("p", "n", scope);
		parent.children.push_back(std::move(leaf));
		leaf = std::move(parent);
	}

	auto const out = serializeXml(leaf);
	std::string expected = "<p:n xmlns:p=\"urn:p\">";
	for(int i = 2; i < depth; ++i)
		expected += "<p:n>";
	expected += "<p:n/>";
	for(int i = 1; i < depth; ++i)
		expected += "</p:n>";
	ASSERT_EQUALS(expected, out);
}
