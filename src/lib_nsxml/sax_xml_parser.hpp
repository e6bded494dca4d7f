#pragma once

#include "lib_utils/small_map.hpp"
#include "lib_utils/span.hpp"
#include <string>

namespace NsXml {

// Raw names: prefixes are not split, xmlns attributes are reported as ordinary attributes.
struct SaxHandler {
	virtual ~SaxHandler() = default;
	virtual void onNodeStart(std::string const& name, SmallMap<std::string, std::string> const& attributes) = 0;
	virtual void onNodeEnd(std::string const& name) = 0;
	virtual void onText(std::string const& content) = 0;
	virtual void onEntityRef(std::string const& /*name*/) {}
	virtual void onCData(std::string const& /*content*/) {}
	virtual void onComment(std::string const& /*content*/) {}
	virtual void onProcInstr(std::string const& /*target*/, std::string const& /*data*/) {}
};

// The XML declaration and DOCTYPE are skipped.
// Predefined entities and character references are decoded; other entity
// references are reported through onEntityRef().
// Throws std::runtime_error on malformed input.
void saxParse(span<const char> input, SaxHandler& handler);

}
