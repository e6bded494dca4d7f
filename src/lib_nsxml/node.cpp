#include "node.hpp"
#include "escape.hpp"
#include "lib_utils/tools.hpp" // enforce

namespace NsXml {

QName splitQName(std::string const& qname) {
	auto const colon = qname.find(':');
	if(colon == std::string::npos)
		return { "", qname };
	return { qname.substr(0, colon), qname.substr(colon + 1) };
}

Node element(std::string const& name, Scope scope) {
	return element("", name, std::move(scope));
}

Node element(std::string const& prefix, std::string const& name, Scope scope) {
	enforce(!name.empty(), "tag name can't be empty");
	enforce(scope != nullptr, "element scope can't be null");
	Node n { Node::Type::Element };
	n.prefix = prefix;
	n.name = name;
	n.scope = std::move(scope);
	return n;
}

Node text(std::string const& content) {
	Node n { Node::Type::Text };
	n.text = content;
	return n;
}

Node cdata(std::string const& content) {
	Node n { Node::Type::CData };
	n.text = content;
	return n;
}

Node comment(std::string const& content) {
	Node n { Node::Type::Comment };
	n.text = content;
	return n;
}

Node entityRef(std::string const& entityName) {
	Node n { Node::Type::EntityRef };
	n.text = entityName;
	return n;
}

Node procInstr(std::string const& target, std::string const& data) {
	Node n { Node::Type::ProcInstr };
	n.target = target;
	n.text = data;
	return n;
}

std::string renderNode(Node const& node) {
	switch(node.type) {
	case Node::Type::Text:
		return escapeText(node.text);
	case Node::Type::CData:
		return "<![CDATA[" + node.text + "]]>";
	case Node::Type::Comment:
		return "<!--" + node.text + "-->";
	case Node::Type::EntityRef:
		return "&" + node.text + ";";
	case Node::Type::ProcInstr:
		if(node.text.empty())
			return "<?" + node.target + "?>";
		return "<?" + node.target + " " + node.text + "?>";
	case Node::Type::Element:
		break;
	}
	throw std::runtime_error("renderNode: elements are rendered by the serializer");
}

}
