#include "tests/tests.hpp"
#include "lib_appcommon/options.hpp"

#define NELEMENTS(a) \
  sizeof(a)/sizeof(*(a))

unittest("CmdLineOptions: no flags") {
	std::string a, b;
	CmdLineOptions opt;
	opt.add("a", "aaa", &a);
	opt.add("b", "bbb", &b);

	const char* argv[] = {
		"progname", "myfile.xml"
	};
	auto res = opt.parse(NELEMENTS(argv), argv);
	ASSERT_EQUALS(std::vector<std::string>({"myfile.xml"}), res);
}

unittest("CmdLineOptions: short names") {
	std::string s;
	int n = -1;
	CmdLineOptions opt;
	opt.add("e", "encoding", &s);
	opt.add("n", "number", &n);

	const char* argv[] = {
		"progname", "-e", "ISO-8859-1", "-n", "34"
	};
	opt.parse(NELEMENTS(argv), argv);
	ASSERT_EQUALS("ISO-8859-1", s);
	ASSERT_EQUALS(34, n);
}

unittest("CmdLineOptions: long names and flag") {
	std::string s;
	bool declaration = false;
	CmdLineOptions opt;
	opt.add("o", "output", &s);
	opt.addFlag("d", "declaration", &declaration);

	const char* argv[] = {
		"progname", "--output", "/dev/null", "--declaration", "-"
	};
	auto res = opt.parse(NELEMENTS(argv), argv);
	ASSERT_EQUALS("/dev/null", s);
	ASSERT_EQUALS(true, declaration);
	ASSERT_EQUALS(std::vector<std::string>({"-"}), res);
}

unittest("CmdLineOptions: unknown option") {
	bool keepGoing = false;
	CmdLineOptions opt;
	opt.addFlag("k", "keepGoing", &keepGoing);

	const char* argv[] = {
		"cmd", "--evil"
	};
	ASSERT_THROWN(opt.parse(NELEMENTS(argv), argv));
}

unittest("CmdLineOptions: unexpected end of command line") {
	std::string inputPath;
	CmdLineOptions opt;
	opt.add("i", "inputPath", &inputPath);

	const char* argv[] = {
		"progname", "-i"
	};
	ASSERT_THROWN(opt.parse(NELEMENTS(argv), argv));
}

unittest("CmdLineOptions: invalid integer") {
	int n = 0;
	CmdLineOptions opt;
	opt.add("n", "number", &n);

	const char* argv[] = {
		"progname", "-n", "many"
	};
	ASSERT_THROWN(opt.parse(NELEMENTS(argv), argv));
}

unittest("CmdLineOptions: help") {
	bool help = false;
	CmdLineOptions opt;
	opt.addFlag("h", "help", &help, "Print usage and exit.");
	std::stringstream ss;
	opt.printHelp(ss);
	ASSERT(ss.str().find("-h, --help") != std::string::npos);
	ASSERT(ss.str().find("Print usage and exit.") != std::string::npos);
}
