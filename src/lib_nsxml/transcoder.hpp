#pragma once

#include <string>

namespace NsXml {

// Converts UTF-8 text to another character encoding, using iconv.
// Conversion state is kept between calls, so a multi-byte sequence may be
// split across two convert() calls.
class Transcoder {
	public:
		Transcoder(std::string const& encoding);
		~Transcoder();

		std::string convert(std::string const& utf8);

		// Throws if a truncated multi-byte sequence is still pending.
		void finish();

		bool isPassThrough() const {
			return m_handle == nullptr;
		}

	private:
		Transcoder(Transcoder const&) = delete;
		Transcoder& operator= (Transcoder const&) = delete;

		std::string const m_encoding;
		void* m_handle = nullptr; // iconv_t, nullptr for UTF-8
		std::string m_pending;
};

bool isUtf8(std::string const& encoding);

}
