#pragma once

#include "namespace_binding.hpp"
#include "lib_utils/small_map.hpp"
#include <string>
#include <vector>

namespace NsXml {

struct QName {
	std::string prefix; // empty for unprefixed names
	std::string name;

	std::string toString() const {
		return prefix.empty() ? name : prefix + ":" + name;
	}

	bool operator==(QName const& other) const {
		return prefix == other.prefix && name == other.name;
	}

	bool operator!=(QName const& other) const {
		return !(*this == other);
	}
};

// Parses "p:name" into {"p", "name"}.
QName splitQName(std::string const& qname);

// Insertion order is kept, and is the output order.
using Attributes = SmallMap<QName, std::string>;

struct Node {
		enum class Type {
			Element,
			Text,
			CData,
			Comment,
			EntityRef,
			ProcInstr,
		};

		Type type;

		////////////////////////////////////////
		// type == Type::Element
		std::string prefix {};
		std::string name {};
		Attributes attr {};
		Scope scope = emptyScope();
		std::vector<Node> children {};

		std::string & operator [] (const char* attributeName) {
			return attr[splitQName(attributeName)];
		}

		Node& add(Node const& child) {
			children.push_back(child);
			return children.back();
		}

		QName qname() const {
			return { prefix, name };
		}

		bool isElement() const {
			return type == Type::Element;
		}

		////////////////////////////////////////
		// Text, CData, Comment: content (unescaped)
		// EntityRef: entity name
		// ProcInstr: data
		std::string text {};

		////////////////////////////////////////
		// type == Type::ProcInstr
		std::string target {};
};

Node element(std::string const& name, Scope scope = emptyScope());
Node element(std::string const& prefix, std::string const& name, Scope scope);
Node text(std::string const& content);
Node cdata(std::string const& content);
Node comment(std::string const& content);
Node entityRef(std::string const& entityName);
Node procInstr(std::string const& target, std::string const& data);

// Literal textual form of a non-element node.
std::string renderNode(Node const& node);

}
