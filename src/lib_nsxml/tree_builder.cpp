#include "tree_builder.hpp"
#include "sax_xml_parser.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/log.hpp"
#include "lib_utils/tools.hpp" // startsWith
#include <cctype>
#include <cstring> // strlen
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

namespace NsXml {

namespace {

// Implicitly bound, never declared.
const char* const XmlPrefix = "xml";
const char* const XmlUri = "http://www.w3.org/XML/1998/namespace";

bool isBlank(std::string const& s) {
	for(auto c : s)
		if(!isspace((unsigned char)c))
			return false;
	return true;
}

struct TreeBuilder : SaxHandler {
	void onNodeStart(std::string const& id, SmallMap<std::string, std::string> const& attributes) override {
		if(stack.empty() && root)
			throw std::runtime_error(format("Unexpected element '%s' after the root element", id));

		auto scope = stack.empty() ? emptyScope() : stack.back()->scope;

		for(auto& a : attributes) {
			if(a.key == "xmlns") {
				scope = bindDefault(a.value, scope);
			} else if(startsWith(a.key, "xmlns:")) {
				auto const prefix = a.key.substr(6);
				if(a.value.empty())
					throw std::runtime_error(format("Prefix '%s' can't be bound to an empty URI", prefix));
				scope = bindPrefix(prefix, a.value, scope);
			}
		}

		auto const qname = splitQName(id);
		if(!qname.prefix.empty() && qname.prefix != XmlPrefix && !scope->findByPrefix(qname.prefix))
			throw std::runtime_error(format("Unbound namespace prefix '%s' on element '%s'", qname.prefix, id));

		auto e = element(qname.prefix, qname.name, scope);

		// (namespace uri, local name) of each prefixed attribute
		std::vector<std::pair<std::string, std::string>> expanded;
		for(auto& a : attributes) {
			if(a.key == "xmlns" || startsWith(a.key, "xmlns:"))
				continue;
			auto const key = splitQName(a.key);
			if(!key.prefix.empty()) {
				if(key.prefix != XmlPrefix && !scope->findByPrefix(key.prefix))
					throw std::runtime_error(format("Unbound namespace prefix '%s' on attribute '%s'", key.prefix, a.key));
				auto const name = std::make_pair(key.prefix == XmlPrefix ? std::string(XmlUri) : scope->findUri(key.prefix), key.name);
				for(auto& other : expanded) {
					if(other == name)
						throw std::runtime_error(format("Attribute '%s' on element '%s' duplicates another attribute in namespace '%s'", a.key, id, name.first));
				}
				expanded.push_back(name);
			}
			e.attr[key] = a.value;
		}

		if(stack.empty()) {
			root = std::make_unique<Node>(std::move(e));
			stack.push_back(root.get());
		} else {
			stack.push_back(&stack.back()->add(e));
		}
	}

	void onNodeEnd(std::string const& id) override {
		if(stack.empty())
			throw std::runtime_error(format("Unexpected closing tag '%s'", id));
		auto const expected = stack.back()->qname().toString();
		if(id != expected)
			throw std::runtime_error(format("Mismatched closing tag: expected '%s', got '%s'", expected, id));
		stack.pop_back();
	}

	void onText(std::string const& content) override {
		if(stack.empty()) {
			if(!isBlank(content))
				throw std::runtime_error("Text content outside of the root element");
			return;
		}
		stack.back()->add(text(content));
	}

	void onEntityRef(std::string const& name) override {
		if(stack.empty())
			throw std::runtime_error(format("Entity reference '&%s;' outside of the root element", name));
		stack.back()->add(entityRef(name));
	}

	void onCData(std::string const& content) override {
		if(stack.empty())
			throw std::runtime_error("CDATA section outside of the root element");
		stack.back()->add(cdata(content));
	}

	void onComment(std::string const& content) override {
		if(!stack.empty())
			stack.back()->add(comment(content));
	}

	void onProcInstr(std::string const& target, std::string const& data) override {
		if(!stack.empty())
			stack.back()->add(procInstr(target, data));
		else
			g_Log->log(Debug, format("[NsXml] dropping processing instruction '%s' outside of the root element", target).c_str());
	}

	std::unique_ptr<Node> root;
	std::vector<Node*> stack; // open elements
};

}

Node parseXml(span<const char> input) {
	TreeBuilder builder;
	saxParse(input, builder);

	if(!builder.root)
		throw std::runtime_error("No root element");
	if(!builder.stack.empty())
		throw std::runtime_error(format("Unclosed element '%s'", builder.stack.back()->qname().toString()));

	return std::move(*builder.root);
}

Node parseXml(std::string const& input) {
	return parseXml(toSpan(input));
}

Node parseXml(const char* input) {
	return parseXml(span<const char>(input, strlen(input)));
}

}
