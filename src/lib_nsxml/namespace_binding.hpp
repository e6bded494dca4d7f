#pragma once

#include <memory>
#include <string>
#include <vector>

namespace NsXml {

struct NamespaceBinding;

// Links are immutable and shared: a child scope points to its parent's link
// instead of copying it.
using Scope = std::shared_ptr<const NamespaceBinding>;

struct NamespaceBinding {
		enum class Type {
			Empty, // chain terminator
			Unprefixed, // default namespace declaration
			Prefixed,
		};

		NamespaceBinding(Type type, std::string prefix, std::string uri, Scope parent);

		Type const type;
		std::string const prefix; // empty unless type == Type::Prefixed
		std::string const uri; // empty when type == Type::Empty
		Scope const parent; // nullptr when type == Type::Empty

		// Nearest link binding 'prefix'. The empty prefix matches the nearest
		// Unprefixed link, or the terminator. Returns nullptr if nothing matches.
		NamespaceBinding const* findByPrefix(std::string const& prefix) const;

		// URI bound to 'prefix', or "" when unbound.
		std::string findUri(std::string const& prefix) const;

		// Every binding of the chain, outermost first. The terminator is not listed.
		std::vector<NamespaceBinding const*> toList() const;

		size_t depth() const;
};

Scope emptyScope();
Scope bindDefault(std::string const& uri, Scope parent = emptyScope());
Scope bindPrefix(std::string const& prefix, std::string const& uri, Scope parent = emptyScope());

}
