#include "transcoder.hpp"
#include "lib_utils/format.hpp"
#include <iconv.h>
#include <cerrno>
#include <cctype> // toupper
#include <stdexcept>

namespace NsXml {

bool isUtf8(std::string const& encoding) {
	std::string s;
	for(auto c : encoding)
		if(c != '-' && c != '_')
			s += (char)toupper((unsigned char)c);
	return s == "UTF8";
}

Transcoder::Transcoder(std::string const& encoding) : m_encoding(encoding) {
	if(isUtf8(encoding))
		return;

	auto cd = iconv_open(encoding.c_str(), "UTF-8");
	if(cd == (iconv_t)-1)
		throw std::runtime_error(format("Unsupported encoding '%s'", encoding));
	m_handle = cd;
}

Transcoder::~Transcoder() {
	if(m_handle)
		iconv_close((iconv_t)m_handle);
}

std::string Transcoder::convert(std::string const& utf8) {
	if(!m_handle)
		return utf8;

	std::string input = m_pending + utf8;
	m_pending.clear();

	std::string r;
	char buffer[1024];
	auto inPtr = const_cast<char*>(input.data());
	size_t inLeft = input.size();

	while(inLeft > 0) {
		auto outPtr = buffer;
		size_t outLeft = sizeof buffer;
		auto const res = iconv((iconv_t)m_handle, &inPtr, &inLeft, &outPtr, &outLeft);
		r.append(buffer, outPtr - buffer);

		if(res != (size_t)-1)
			break;

		switch(errno) {
		case E2BIG:
			continue;
		case EINVAL:
			// incomplete sequence at the end of the input: keep it for the next call
			m_pending.assign(inPtr, inLeft);
			return r;
		case EILSEQ:
			throw std::runtime_error(format("Character at offset %s can't be represented in '%s'", input.size() - inLeft, m_encoding));
		default:
			throw std::runtime_error(format("Conversion to '%s' failed (errno=%s)", m_encoding, errno));
		}
	}

	return r;
}

void Transcoder::finish() {
	if(!m_pending.empty())
		throw std::runtime_error(format("Truncated UTF-8 sequence at end of output ('%s')", m_encoding));
}

}
