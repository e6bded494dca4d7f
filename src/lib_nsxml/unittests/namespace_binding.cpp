#include "tests/tests.hpp"
#include "lib_nsxml/namespace_binding.hpp"

using namespace NsXml;

unittest("namespace binding: nearest binding wins") {
	auto outer = bindPrefix("p", "urn:outer");
	auto inner = bindPrefix("p", "urn:inner", outer);

	ASSERT_EQUALS("urn:inner", inner->findByPrefix("p")->uri);
	ASSERT_EQUALS("urn:outer", outer->findByPrefix("p")->uri);
	ASSERT_EQUALS("urn:inner", inner->findUri("p"));
}

unittest("namespace binding: empty prefix") {
	auto withDefault = bindPrefix("p", "urn:p", bindDefault("urn:d"));
	auto found = withDefault->findByPrefix("");
	ASSERT(found != nullptr);
	ASSERT(found->type == NamespaceBinding::Type::Unprefixed);
	ASSERT_EQUALS("urn:d", found->uri);

	auto noDefault = bindPrefix("p", "urn:p");
	found = noDefault->findByPrefix("");
	ASSERT(found != nullptr);
	ASSERT(found->type == NamespaceBinding::Type::Empty);
	ASSERT_EQUALS("", noDefault->findUri(""));
}

unittest("namespace binding: unknown prefix") {
	auto scope = bindDefault("urn:d", bindPrefix("a", "urn:a"));
	ASSERT(scope->findByPrefix("b") == nullptr);
	ASSERT_EQUALS("", scope->findUri("b"));
	ASSERT(emptyScope()->findByPrefix("a") == nullptr);
}

unittest("namespace binding: list is outermost first") {
	auto scope = bindPrefix("c", "urn:c", bindDefault("urn:d", bindPrefix("a", "urn:a")));
	auto list = scope->toList();
	ASSERT_EQUALS(3u, list.size());
	ASSERT_EQUALS("a", list[0]->prefix);
	ASSERT(list[1]->type == NamespaceBinding::Type::Unprefixed);
	ASSERT_EQUALS("c", list[2]->prefix);
	ASSERT_EQUALS(3u, scope->depth());

	ASSERT(emptyScope()->toList().empty());
	ASSERT_EQUALS(0u, emptyScope()->depth());
}

unittest("namespace binding: children share the parent link") {
	auto parent = bindPrefix("a", "urn:a");
	auto child1 = bindPrefix("b", "urn:b", parent);
	auto child2 = bindDefault("urn:d", parent);
	ASSERT(child1->parent == parent);
	ASSERT(child2->parent == parent);
	ASSERT(parent->parent == emptyScope());
}

unittest("namespace binding: prefixed binding needs a prefix") {
	ASSERT_THROWN(bindPrefix("", "urn:x"));
	ASSERT_THROWN(bindDefault("urn:x", nullptr));
}
