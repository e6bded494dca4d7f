// XML generator from a tree, with namespace declarations
#pragma once

#include "node.hpp"
#include "writer.hpp"
#include <ostream>
#include <string>

namespace NsXml {

///////////////////////////////////////////////////////////////////////////////
// Element tree serialization

// Writes 'root' and its descendants to 'w', without XML declaration.
// xmlns attributes are written where an element needs a binding that its
// serialized ancestors don't already provide.
// Errors thrown by 'w' propagate, leaving the output partially written.
void serialize(Node const& root, IWriter& w);

std::string serializeXml(Node const& root);

///////////////////////////////////////////////////////////////////////////////
// Document serialization

class XmlSerializer {
	public:
		XmlSerializer(std::string encoding = "UTF-8", bool outputDeclaration = false);

		// Writes the XML declaration (when enabled) then the tree.
		// The caller is responsible for 'w' matching the configured encoding.
		void serializeDocument(Node const& root, IWriter& w) const;

		// Same, converting the output to the configured encoding.
		void serializeDocument(Node const& root, std::ostream& o) const;

		// The file is closed before returning, including on errors.
		void serializeDocumentToFile(Node const& root, std::string const& path) const;

		void serialize(Node const& root, IWriter& w) const;

		std::string const& encoding() const {
			return m_encoding;
		}

		bool outputDeclaration() const {
			return m_outputDeclaration;
		}

	private:
		std::string const m_encoding;
		bool const m_outputDeclaration;
};

}
