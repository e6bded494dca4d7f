#pragma once

#include "transcoder.hpp"
#include <ostream>
#include <string>

namespace NsXml {

// Append-only text sink. Implementations report I/O failures by throwing.
struct IWriter {
	virtual ~IWriter() = default;
	virtual void write(std::string const& text) = 0;
};

struct StringWriter : IWriter {
	StringWriter(std::string& out) : out(out) {
	}

	void write(std::string const& text) override {
		out += text;
	}

	std::string& out;
};

// Writes to a byte stream, converting from UTF-8 to 'encoding'.
class StreamWriter : public IWriter {
	public:
		StreamWriter(std::ostream& stream, std::string const& encoding = "UTF-8");

		void write(std::string const& text) override;
		void flush();

	private:
		void check();

		std::ostream& m_stream;
		Transcoder m_transcoder;
};

}
