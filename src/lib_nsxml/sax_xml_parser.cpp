#include "sax_xml_parser.hpp"
#include "lib_utils/format.hpp"
#include <cctype>
#include <cstdlib> // strtoul
#include <cstring> // strlen, memcmp
#include <stdexcept>

namespace NsXml {

namespace {
bool isNameChar(char c) {
	return isalnum((unsigned char)c) || c == ':' || c == '_' || c == '-' || c == '.' || (unsigned char)c >= 0x80;
}

// The 'Char' production of XML 1.0.
bool isXmlChar(unsigned long cp) {
	return cp == 0x9 || cp == 0xA || cp == 0xD
		|| (cp >= 0x20 && cp <= 0xD7FF)
		|| (cp >= 0xE000 && cp <= 0xFFFD)
		|| (cp >= 0x10000 && cp <= 0x10FFFF);
}

std::string toUtf8(unsigned long cp) {
	std::string r;
	if(cp < 0x80) {
		r += (char)cp;
	} else if(cp < 0x800) {
		r += (char)(0xC0 | (cp >> 6));
		r += (char)(0x80 | (cp & 0x3F));
	} else if(cp < 0x10000) {
		r += (char)(0xE0 | (cp >> 12));
		r += (char)(0x80 | ((cp >> 6) & 0x3F));
		r += (char)(0x80 | (cp & 0x3F));
	} else if(cp < 0x110000) {
		r += (char)(0xF0 | (cp >> 18));
		r += (char)(0x80 | ((cp >> 12) & 0x3F));
		r += (char)(0x80 | ((cp >> 6) & 0x3F));
		r += (char)(0x80 | (cp & 0x3F));
	} else {
		throw std::runtime_error(format("Invalid character reference: %s", cp));
	}
	return r;
}

// Returns false for entities that are not predefined.
bool decodeReference(std::string const& ref, std::string& out) {
	if(ref == "lt") out += '<';
	else if(ref == "gt") out += '>';
	else if(ref == "amp") out += '&';
	else if(ref == "quot") out += '"';
	else if(ref == "apos") out += '\'';
	else if(ref.size() > 1 && ref[0] == '#') {
		auto const hex = ref[1] == 'x';
		auto const digits = ref.substr(hex ? 2 : 1);
		char* end = nullptr;
		auto const cp = strtoul(digits.c_str(), &end, hex ? 16 : 10);
		if(digits.empty() || *end != 0)
			throw std::runtime_error(format("Invalid character reference: '&%s;'", ref));
		if(!isXmlChar(cp))
			throw std::runtime_error(format("Character reference '&%s;' is not an XML character", ref));
		out += toUtf8(cp);
	} else
		return false;
	return true;
}
}

void saxParse(span<const char> input, SaxHandler& handler) {
	using namespace std;

	auto front = [&]() -> char {
		if(input.len == 0)
			throw runtime_error("Unexpected end of file");

		return input[0];
	};

	auto peek = [&](const char* str) {
		auto const n = strlen(str);
		return input.len >= n && memcmp(input.ptr, str, n) == 0;
	};

	auto accept = [&](char c) {
		if(input.len == 0 || c != input[0])
			return false;

		input += 1;
		return true;
	};

	auto expect = [&](char c) {
		if(!accept(c)) {
			string msg = "expected '";
			msg += c;
			msg += "', got '";
			msg += input.len ? input[0] : '?';
			msg += "'";
			throw runtime_error(msg);
		}
	};

	auto skipSpaces = [&]() {
		while(input.len && isspace((unsigned char)input[0]))
			input += 1;
	};

	auto readUntil = [&](const char* terminator) {
		string r;
		while(!peek(terminator)) {
			r += front();
			input += 1;
		}
		input += strlen(terminator);
		return r;
	};

	auto parseIdentifier = [&]() {
		string r;
		while(input.len && isNameChar(input[0])) {
			r += input[0];
			input += 1;
		}
		if(r.empty()) {
			string msg = "expected an XML name, got '";
			msg += input.len ? input[0] : '?';
			msg += "'";
			throw runtime_error(msg);
		}
		return r;
	};

	// after '&'
	auto parseReference = [&]() {
		string ref;
		while(front() != ';') {
			if(!isNameChar(front()) && front() != '#')
				throw runtime_error("Malformed entity reference: '&" + ref + "'");
			ref += front();
			input += 1;
		}
		input += 1;
		return ref;
	};

	auto parseString = [&]() {
		auto const quote = front();
		if(quote != '"' && quote != '\'')
			throw runtime_error("expected a quoted attribute value");
		input += 1;

		string r;
		while(front() != quote) {
			if(front() == '<')
				throw runtime_error("'<' is not allowed in attribute values");
			if(accept('&')) {
				auto ref = parseReference();
				if(!decodeReference(ref, r))
					throw runtime_error("Unknown entity in attribute value: '&" + ref + ";'");
				continue;
			}
			r += front();
			input += 1;
		}
		input += 1;
		return r;
	};

	auto skipDoctype = [&]() {
		int depth = 0;
		while(true) {
			auto const c = front();
			input += 1;
			if(c == '[')
				depth++;
			else if(c == ']')
				depth--;
			else if(c == '>' && depth == 0)
				return;
		}
	};

	string content;

	auto flushContent = [&]() {
		if(!content.empty())
			handler.onText(content);
		content.clear();
	};

	auto parseTag = [&]() {
		if(peek("!--")) {
			input += 3;
			handler.onComment(readUntil("-->"));
		} else if(peek("![CDATA[")) {
			input += 8;
			handler.onCData(readUntil("]]>"));
		} else if(peek("!DOCTYPE")) {
			skipDoctype();
		} else if(accept('?')) {
			auto target = parseIdentifier();
			skipSpaces();
			auto data = readUntil("?>");
			while(!data.empty() && isspace((unsigned char)data.back()))
				data.pop_back();
			if(target != "xml")
				handler.onProcInstr(target, data);
		} else if(accept('/')) {
			// closing tag
			auto id = parseIdentifier();
			skipSpaces();
			expect('>');
			handler.onNodeEnd(id);
		} else {
			// opening tag
			auto id = parseIdentifier();
			skipSpaces();

			SmallMap<string, string> attr;

			while(front() != '>' && front() != '/') {
				auto name = parseIdentifier();
				skipSpaces();
				expect('=');
				skipSpaces();
				if(attr.contains(name))
					throw runtime_error("Duplicate attribute '" + name + "' on element '" + id + "'");
				attr[name] = parseString();
				skipSpaces();
			}

			handler.onNodeStart(id, attr);

			if(accept('/')) {
				expect('>');
				handler.onNodeEnd(id);
			} else {
				expect('>');
			}
		}
	};

	while(input.len) {
		if(accept('<')) {
			flushContent();
			parseTag();
		} else if(accept('&')) {
			auto ref = parseReference();
			if(!decodeReference(ref, content)) {
				flushContent();
				handler.onEntityRef(ref);
			}
		} else {
			content += input[0];
			input += 1;
		}
	}

	flushContent();
}

}
