#include "writer.hpp"
#include <stdexcept>

namespace NsXml {

StreamWriter::StreamWriter(std::ostream& stream, std::string const& encoding)
	: m_stream(stream), m_transcoder(encoding) {
	check();
}

void StreamWriter::write(std::string const& text) {
	auto const bytes = m_transcoder.convert(text);
	m_stream.write(bytes.data(), bytes.size());
	check();
}

void StreamWriter::flush() {
	m_transcoder.finish();
	m_stream.flush();
	check();
}

void StreamWriter::check() {
	if(!m_stream)
		throw std::runtime_error("Write error on output stream");
}

}
