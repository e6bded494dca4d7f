#pragma once

#include "node.hpp"
#include <string>

namespace NsXml {

// Character data: escapes '&', '<' and '>'.
std::string escapeText(std::string const& s);

// Quoted attribute value, quotes included.
// Double quotes are used unless the value contains '"' but no '\''.
std::string quoteAttribute(std::string const& value);

// key="value"
std::string encodeAttribute(QName const& key, std::string const& value);

}
