#include "reformat.hpp"
#include "lib_nsxml/serializer.hpp"
#include "lib_nsxml/tree_builder.hpp"
#include "lib_nsxml/writer.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/log.hpp"

using namespace NsXml;

void reformat(Config const& cfg, std::string const& input, std::ostream& out) {
	auto const root = parseXml(input);

	XmlSerializer serializer(cfg.encoding, cfg.declaration);
	if(cfg.outputPath.empty()) {
		StreamWriter w(out, cfg.encoding);
		serializer.serializeDocument(root, w);
		w.write("\n");
		w.flush();
	} else {
		serializer.serializeDocumentToFile(root, cfg.outputPath);
		g_Log->log(Info, format("[nsxmlfmt] wrote '%s'", cfg.outputPath).c_str());
	}
}
