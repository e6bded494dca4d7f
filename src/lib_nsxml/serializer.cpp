#include "serializer.hpp"
#include "escape.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/log.hpp"
#include "lib_utils/tools.hpp" // enforce
#include <fstream>
#include <vector>

namespace NsXml {

namespace {

struct Declaration {
	std::string prefix, uri;
};

// Effective default namespace change made by one element.
struct DefaultOverride {
	bool changed;
	std::string uri; // "" resets to no namespace
};

class TreeSerializer {
	public:
		TreeSerializer(IWriter& w) : w(w) {
		}

		void serializeNode(Node const& node) {
			if(node.isElement())
				serializeElement(node);
			else
				w.write(renderNode(node));
		}

	private:
		// Pops one level of each stack when the element is left, also on error.
		struct LevelGuard {
			LevelGuard(TreeSerializer& s, std::vector<Declaration> declared, DefaultOverride defaultNs) : s(s) {
				s.m_declared.push_back(std::move(declared));
				s.m_defaults.push_back(std::move(defaultNs));
			}
			~LevelGuard() {
				s.m_declared.pop_back();
				s.m_defaults.pop_back();
			}
			TreeSerializer& s;
		};

		void serializeElement(Node const& e) {
			if(!e.scope)
				throw std::runtime_error(format("element '%s' has no scope", e.name));

			auto ownBinding = e.scope->findByPrefix(e.prefix);
			if(!ownBinding && !e.prefix.empty())
				g_Log->log(Warning, format("[NsXml] no namespace binding for prefix '%s' of element '%s', writing it unqualified", e.prefix, e.name).c_str());

			auto const currentDefaultUri = getCurrentDefaultUri();

			std::string qname = e.name;
			std::string xmlns;
			DefaultOverride defaultNs { false, "" };

			auto const type = ownBinding ? ownBinding->type : NamespaceBinding::Type::Empty;
			switch(type) {
			case NamespaceBinding::Type::Empty:
				if(!currentDefaultUri.empty()) {
					defaultNs = { true, "" };
					xmlns = " " + encodeAttribute({ "", "xmlns" }, "");
				}
				break;
			case NamespaceBinding::Type::Unprefixed:
				if(ownBinding->uri != currentDefaultUri) {
					defaultNs = { true, ownBinding->uri };
					xmlns = " " + encodeAttribute({ "", "xmlns" }, ownBinding->uri);
				}
				break;
			case NamespaceBinding::Type::Prefixed:
				qname = ownBinding->prefix + ":" + e.name;
				break;
			}

			auto declared = getNewDeclarations(*e.scope);

			std::string tag = "<" + qname + xmlns;

			for(auto& d : declared)
				tag += " " + encodeAttribute({ "xmlns", d.prefix }, d.uri);

			for(auto& a : e.attr)
				tag += " " + encodeAttribute(a.key, a.value);

			LevelGuard level(*this, std::move(declared), std::move(defaultNs));

			if(e.children.empty()) {
				w.write(tag + "/>");
			} else {
				w.write(tag + ">");

				for(auto& child : e.children)
					serializeNode(child);

				w.write("</" + qname + ">");
			}
		}

		std::string getCurrentDefaultUri() const {
			for(auto i = m_defaults.rbegin(); i != m_defaults.rend(); ++i) {
				if(i->changed)
					return i->uri;
			}
			return "";
		}

		// True when the nearest ancestor declaration of 'prefix' binds it to 'uri'.
		bool isDeclared(std::string const& prefix, std::string const& uri) const {
			for(auto level = m_declared.rbegin(); level != m_declared.rend(); ++level) {
				for(auto& d : *level) {
					if(d.prefix == prefix)
						return d.uri == uri;
				}
			}
			return false;
		}

		// Prefixed bindings in effect at 'scope' that the output doesn't provide yet,
		// outermost first.
		std::vector<Declaration> getNewDeclarations(NamespaceBinding const& scope) const {
			auto const bindings = scope.toList();

			auto isShadowed = [&](size_t idx) {
				for(auto i = idx + 1; i < bindings.size(); ++i) {
					if(bindings[i]->type == NamespaceBinding::Type::Prefixed && bindings[i]->prefix == bindings[idx]->prefix)
						return true;
				}
				return false;
			};

			std::vector<Declaration> r;
			for(size_t i = 0; i < bindings.size(); ++i) {
				auto b = bindings[i];
				if(b->type != NamespaceBinding::Type::Prefixed || isShadowed(i))
					continue;
				if(!isDeclared(b->prefix, b->uri))
					r.push_back({ b->prefix, b->uri });
			}
			return r;
		}

		IWriter& w;
		std::vector<std::vector<Declaration>> m_declared; // one entry per open element
		std::vector<DefaultOverride> m_defaults; // one entry per open element
};

}

void serialize(Node const& root, IWriter& w) {
	enforce(root.isElement(), "serialize: the root node must be an element");
	TreeSerializer serializer(w);
	serializer.serializeNode(root);
}

std::string serializeXml(Node const& root) {
	std::string r;
	StringWriter w(r);
	serialize(root, w);
	return r;
}

XmlSerializer::XmlSerializer(std::string encoding, bool outputDeclaration)
	: m_encoding(std::move(encoding)), m_outputDeclaration(outputDeclaration) {
	enforce(!m_encoding.empty(), "XmlSerializer: encoding can't be empty");
}

void XmlSerializer::serializeDocument(Node const& root, IWriter& w) const {
	if(m_outputDeclaration)
		w.write("<?xml version=\"1.0\" encoding=\"" + m_encoding + "\" standalone=\"yes\"?>");
	serialize(root, w);
}

void XmlSerializer::serializeDocument(Node const& root, std::ostream& o) const {
	StreamWriter w(o, m_encoding);
	serializeDocument(root, w);
	w.flush();
}

void XmlSerializer::serializeDocumentToFile(Node const& root, std::string const& path) const {
	std::ofstream file(path, std::ios::binary);
	if(!file)
		throw std::runtime_error(format("Can't open '%s' for writing", path));

	g_Log->log(Debug, format("[NsXml] writing '%s' (encoding=%s)", path, m_encoding).c_str());
	serializeDocument(root, file);

	file.close();
	if(!file)
		throw std::runtime_error(format("Can't close '%s'", path));
}

void XmlSerializer::serialize(Node const& root, IWriter& w) const {
	NsXml::serialize(root, w);
}

}
