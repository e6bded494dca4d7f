#pragma once

#include "node.hpp"
#include "lib_utils/span.hpp"
#include <string>

namespace NsXml {

// Builds the element tree of a document.
// Each element's scope extends its parent's with the element's own xmlns
// attributes, which are not kept in 'attr'.
// Content outside the root element (comments, processing instructions,
// whitespace) is dropped.
Node parseXml(span<const char> input);
Node parseXml(std::string const& input);
Node parseXml(const char* input);

}
