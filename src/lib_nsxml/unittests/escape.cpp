#include "tests/tests.hpp"
#include "lib_nsxml/escape.hpp"
#include "lib_nsxml/node.hpp"

using namespace NsXml;

unittest("escape: text") {
	ASSERT_EQUALS("a &lt;b&gt; &amp;amp; \"'", escapeText("a <b> &amp; \"'"));
	ASSERT_EQUALS("", escapeText(""));
}

unittest("escape: attribute values are double-quoted by default") {
	ASSERT_EQUALS("\"1\"", quoteAttribute("1"));
	ASSERT_EQUALS("\"\"", quoteAttribute(""));
	ASSERT_EQUALS("\"&lt;&amp;&gt;\"", quoteAttribute("<&>"));
	ASSERT_EQUALS("\"it's\"", quoteAttribute("it's"));
}

unittest("escape: attribute value containing double quotes") {
	ASSERT_EQUALS("'say \"hi\"'", quoteAttribute("say \"hi\""));
	ASSERT_EQUALS("\"a&quot;b'c\"", quoteAttribute("a\"b'c"));
}

unittest("escape: encoded attribute") {
	ASSERT_EQUALS("id=\"1\"", encodeAttribute({ "", "id" }, "1"));
	ASSERT_EQUALS("xl:href=\"#a\"", encodeAttribute({ "xl", "href" }, "#a"));
}
