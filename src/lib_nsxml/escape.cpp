#include "escape.hpp"

namespace NsXml {

namespace {
std::string escapeXmlEntities(std::string const& s, char quote) {
	std::string r;
	r.reserve(s.size());

	for(auto c : s) {
		switch(c) {
		case '&': r += "&amp;";
			break;
		case '<': r += "&lt;";
			break;
		case '>': r += "&gt;";
			break;
		case '"':
			if(quote == '"')
				r += "&quot;";
			else
				r += c;
			break;
		case '\'':
			if(quote == '\'')
				r += "&apos;";
			else
				r += c;
			break;
		default: r += c;
			break;
		}
	}

	return r;
}
}

std::string escapeText(std::string const& s) {
	return escapeXmlEntities(s, 0);
}

std::string quoteAttribute(std::string const& value) {
	auto const hasDouble = value.find('"') != std::string::npos;
	auto const hasSingle = value.find('\'') != std::string::npos;
	auto const quote = (hasDouble && !hasSingle) ? '\'' : '"';
	return quote + escapeXmlEntities(value, quote) + quote;
}

std::string encodeAttribute(QName const& key, std::string const& value) {
	return key.toString() + "=" + quoteAttribute(value);
}

}
