#include "tests/tests.hpp"
#include "lib_nsxml/serializer.hpp"
#include "lib_nsxml/transcoder.hpp"
#include <cstdio> // remove
#include <fstream>
#include <sstream>

using namespace NsXml;

namespace {
std::string readFile(std::string const& path) {
	std::ifstream file(path, std::ios::binary);
	std::stringstream ss;
	ss << file.rdbuf();
	return ss.str();
}

Node makeDocument(std::string const& content) {
	auto root = element("a", bindDefault("urn:a"));
	root.add(text(content));
	return root;
}
}

unittest("document: no declaration by default") {
	XmlSerializer serializer;
	ASSERT_EQUALS("UTF-8", serializer.encoding());
	ASSERT(!serializer.outputDeclaration());

	std::string out;
	StringWriter w(out);
	serializer.serializeDocument(element("a"), w);
	ASSERT_EQUALS("<a/>", out);
}

unittest("document: declaration") {
	std::string out;
	StringWriter w(out);
	XmlSerializer("ISO-8859-1", true).serializeDocument(element("a"), w);
	ASSERT_EQUALS("<?xml version=\"1.0\" encoding=\"ISO-8859-1\" standalone=\"yes\"?><a/>", out);
}

unittest("document: fragment serialization has no declaration") {
	std::string out;
	StringWriter w(out);
	XmlSerializer("UTF-8", true).serialize(element("a"), w);
	ASSERT_EQUALS("<a/>", out);
}

unittest("document: utf-8 stream") {
	std::stringstream ss;
	XmlSerializer("UTF-8", true).serializeDocument(makeDocument("\xC3\xA9t\xC3\xA9"), ss);
	ASSERT_EQUALS("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?><a xmlns=\"urn:a\">\xC3\xA9t\xC3\xA9</a>", ss.str());
}

unittest("document: stream converted to the configured encoding") {
	std::stringstream ss;
	XmlSerializer("ISO-8859-1").serializeDocument(makeDocument("\xC3\xA9t\xC3\xA9"), ss);
	ASSERT_EQUALS("<a xmlns=\"urn:a\">\xE9t\xE9</a>", ss.str());
}

unittest("document: character not representable in the encoding") {
	std::stringstream ss;
	ASSERT_THROWN(XmlSerializer("US-ASCII").serializeDocument(makeDocument("\xC3\xA9"), ss));
	ASSERT_EQUALS("<a xmlns=\"urn:a\">", ss.str());
}

unittest("document: unknown encoding") {
	std::stringstream ss;
	ASSERT_THROWN(XmlSerializer("NO-SUCH-ENCODING").serializeDocument(element("a"), ss));
	ASSERT_EQUALS("", ss.str());
}

unittest("document: failed stream") {
	std::stringstream ss;
	ss.setstate(std::ios::badbit);
	ASSERT_THROWN(XmlSerializer().serializeDocument(element("a"), ss));
}

unittest("document: file") {
	auto const path = "nsxml_unittest_document.xml";
	XmlSerializer("UTF-8", true).serializeDocumentToFile(makeDocument("x"), path);
	ASSERT_EQUALS("<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?><a xmlns=\"urn:a\">x</a>", readFile(path));
	std::remove(path);
}

unittest("document: file is released when serialization fails") {
	auto const path = "nsxml_unittest_failure.xml";
	ASSERT_THROWN(XmlSerializer("US-ASCII").serializeDocumentToFile(makeDocument("\xC3\xA9"), path));

	// partial output was flushed by closing the file
	ASSERT_EQUALS("<a xmlns=\"urn:a\">", readFile(path));

	// and the file can be written again
	XmlSerializer("US-ASCII").serializeDocumentToFile(makeDocument("e"), path);
	ASSERT_EQUALS("<a xmlns=\"urn:a\">e</a>", readFile(path));
	std::remove(path);
}

unittest("document: file can't be created") {
	ASSERT_THROWN(XmlSerializer().serializeDocumentToFile(element("a"), "no_such_directory/out.xml"));
}

unittest("transcoder: utf-8 is passed through") {
	Transcoder t("utf8");
	ASSERT(t.isPassThrough());
	ASSERT_EQUALS("\xC3\xA9", t.convert("\xC3\xA9"));
	ASSERT(isUtf8("UTF-8"));
	ASSERT(isUtf8("utf_8"));
	ASSERT(!isUtf8("UTF-16"));
}

unittest("transcoder: sequence split across calls") {
	Transcoder t("ISO-8859-1");
	ASSERT(!t.isPassThrough());
	ASSERT_EQUALS("a", t.convert("a\xC3"));
	ASSERT_EQUALS("\xE9" "b", t.convert("\xA9" "b"));
	t.finish();
}

unittest("transcoder: truncated sequence") {
	Transcoder t("ISO-8859-1");
	t.convert("\xC3");
	ASSERT_THROWN(t.finish());
}

unittest("transcoder: large input") {
	Transcoder t("UTF-16LE");
	std::string input(5000, 'x');
	auto const out = t.convert(input);
	ASSERT_EQUALS(10000u, out.size());
	ASSERT_EQUALS('x', out[0]);
	ASSERT_EQUALS('\0', out[1]);
}
