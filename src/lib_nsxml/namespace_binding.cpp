#include "namespace_binding.hpp"
#include "lib_utils/tools.hpp" // enforce
#include <algorithm> // reverse

namespace NsXml {

NamespaceBinding::NamespaceBinding(Type type, std::string prefix, std::string uri, Scope parent)
	: type(type), prefix(std::move(prefix)), uri(std::move(uri)), parent(std::move(parent)) {
}

NamespaceBinding const* NamespaceBinding::findByPrefix(std::string const& p) const {
	for(auto link = this; link; link = link->parent.get()) {
		switch(link->type) {
		case Type::Empty:
			return p.empty() ? link : nullptr;
		case Type::Unprefixed:
			if(p.empty())
				return link;
			break;
		case Type::Prefixed:
			if(p == link->prefix)
				return link;
			break;
		}
	}
	return nullptr;
}

std::string NamespaceBinding::findUri(std::string const& p) const {
	auto link = findByPrefix(p);
	return link ? link->uri : std::string();
}

std::vector<NamespaceBinding const*> NamespaceBinding::toList() const {
	std::vector<NamespaceBinding const*> r;
	for(auto link = this; link && link->type != Type::Empty; link = link->parent.get())
		r.push_back(link);
	std::reverse(r.begin(), r.end());
	return r;
}

size_t NamespaceBinding::depth() const {
	size_t n = 0;
	for(auto link = this; link && link->type != Type::Empty; link = link->parent.get())
		++n;
	return n;
}

Scope emptyScope() {
	static const Scope terminator = std::make_shared<NamespaceBinding>(NamespaceBinding::Type::Empty, "", "", nullptr);
	return terminator;
}

Scope bindDefault(std::string const& uri, Scope parent) {
	enforce(parent != nullptr, "namespace binding: null parent scope");
	return std::make_shared<NamespaceBinding>(NamespaceBinding::Type::Unprefixed, "", uri, std::move(parent));
}

Scope bindPrefix(std::string const& prefix, std::string const& uri, Scope parent) {
	enforce(!prefix.empty(), "namespace binding: a prefixed binding needs a non-empty prefix");
	enforce(parent != nullptr, "namespace binding: null parent scope");
	return std::make_shared<NamespaceBinding>(NamespaceBinding::Type::Prefixed, prefix, uri, std::move(parent));
}

}
