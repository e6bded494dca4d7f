#include "tests/tests.hpp"
#include "lib_nsxml/node.hpp"

using namespace NsXml;

unittest("node: qualified names") {
	auto q = splitQName("p:name");
	ASSERT_EQUALS("p", q.prefix);
	ASSERT_EQUALS("name", q.name);
	ASSERT_EQUALS("p:name", q.toString());

	q = splitQName("name");
	ASSERT_EQUALS("", q.prefix);
	ASSERT_EQUALS("name", q.toString());
}

unittest("node: render non-element nodes") {
	ASSERT_EQUALS("1 &lt; 2", renderNode(text("1 < 2")));
	ASSERT_EQUALS("<![CDATA[1 < 2]]>", renderNode(cdata("1 < 2")));
	ASSERT_EQUALS("<!-- note -->", renderNode(comment(" note ")));
	ASSERT_EQUALS("&nbsp;", renderNode(entityRef("nbsp")));
	ASSERT_EQUALS("<?php echo 1;?>", renderNode(procInstr("php", "echo 1;")));
	ASSERT_EQUALS("<?break?>", renderNode(procInstr("break", "")));
}

unittest("node: elements are not rendered as leaves") {
	ASSERT_THROWN(renderNode(element("a")));
}

unittest("node: attribute access keeps insertion order") {
	auto e = element("e");
	e["z"] = "1";
	e["a"] = "2";
	e["xl:href"] = "3";
	e["z"] = "4";

	ASSERT_EQUALS(3u, e.attr.size());
	auto i = e.attr.begin();
	ASSERT_EQUALS("z", (*i).key.toString());
	ASSERT_EQUALS("4", (*i).value);
	++i;
	ASSERT_EQUALS("a", (*i).key.toString());
	++i;
	ASSERT_EQUALS("xl", (*i).key.prefix);
	ASSERT_EQUALS("href", (*i).key.name);
}

unittest("node: element needs a name") {
	ASSERT_THROWN(element(""));
	ASSERT_THROWN(element("p", "a", nullptr));
}
