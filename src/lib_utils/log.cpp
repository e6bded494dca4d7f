#include "log.hpp"
#include <chrono>
#include <cstdio>
#include <cstdlib> // getenv
#include <ctime>
#include <iostream>
#include <stdexcept>

#ifdef _WIN32
#include <windows.h>
#include <wincon.h>
static HANDLE console = NULL;
static WORD console_attr_ori = 0;

#else /*_WIN32*/

#define RED    "\x1b[31m"
#define YELLOW "\x1b[33m"
#define GREEN  "\x1b[32m"
#define CYAN   "\x1b[36m"
#define RESET  "\x1b[0m"
#endif /*_WIN32*/

static const auto g_startTime = std::chrono::steady_clock::now();

static std::ostream& get(Level level) {
	switch (level) {
	case Info:
		return std::cout;
	default:
		return std::cerr;
	}
}

static std::string getTime() {
	char szOut[255];
	const std::time_t t = std::time(nullptr);
	const std::tm tm = *std::gmtime(&t);
	auto const size = strftime(szOut, sizeof szOut, "%Y/%m/%d %H:%M:%S", &tm);
	auto timeString = std::string(szOut, size);
	auto const elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - g_startTime);
	snprintf(szOut, sizeof szOut, "[%s][%.1f]", timeString.c_str(), elapsed.count());
	return szOut;
}

struct ConsoleLogger : LogSink {
	void setColor(Level level) {
		if (!m_color) return;
#ifdef _WIN32
		if (console == NULL) {
			CONSOLE_SCREEN_BUFFER_INFO console_info;
			console = GetStdHandle(STD_ERROR_HANDLE);
			if (console != INVALID_HANDLE_VALUE) {
				GetConsoleScreenBufferInfo(console, &console_info);
				console_attr_ori = console_info.wAttributes;
			}
		}
		switch (level) {
		case Error: SetConsoleTextAttribute(console, FOREGROUND_RED | FOREGROUND_INTENSITY); break;
		case Warning: SetConsoleTextAttribute(console, FOREGROUND_INTENSITY | FOREGROUND_RED | FOREGROUND_GREEN); break;
		case Info: SetConsoleTextAttribute(console, FOREGROUND_INTENSITY | FOREGROUND_GREEN); break;
		case Debug: SetConsoleTextAttribute(console, FOREGROUND_GREEN); break;
		default: break;
		}
#else
		switch (level) {
		case Error: fprintf(stderr, RED); break;
		case Warning: fprintf(stderr, YELLOW); break;
		case Info: fprintf(stderr, GREEN); break;
		case Debug: fprintf(stderr, CYAN); break;
		default: break;
		}
#endif
	}

	void resetColor() {
		if (!m_color) return;
#ifdef _WIN32
		SetConsoleTextAttribute(console, console_attr_ori);
#else
		fprintf(stderr, RESET);
#endif
	}

	void send(Level level, const char* msg) override {
		setColor(level);
		get(level) << getTime() << " " << msg << std::endl;
		resetColor();
	}
	bool m_color = true;
};

static ConsoleLogger consoleLogger;

struct CsvLogger : LogSink {
	CsvLogger(const char* path) : m_fp(fopen(path, "w")) {
		if(!m_fp)
			throw std::runtime_error("Can't open '" + std::string(path) + "' for writing");
	}
	~CsvLogger() {
		fclose(m_fp);
	}
	void send(Level level, const char* msg) override {
		fprintf(m_fp, "%s, \"%s\", \"%s\"\n", levelName(level), getTime().c_str(), msg);
		fflush(m_fp);
	}
	FILE* const m_fp;
};

void setGlobalLogConsole(bool color_enable)  {
	consoleLogger.m_color = color_enable;
	g_Log = &consoleLogger;
}

void setGlobalLogCSV(const char* path) {
	static CsvLogger csvLogger(path);
	g_Log = &csvLogger;
}

static
LogSink* getDefaultLogger() {
	if(auto path = std::getenv("NSXML_LOGPATH")) {
		setGlobalLogCSV(path);
		return g_Log;
	}
	return &consoleLogger;
}

LogSink* g_Log = getDefaultLogger();

void setGlobalLogSink(LogSink* sink) {
	g_Log = sink ? sink : getDefaultLogger();
}

Level getGlobalLogLevel() {
	return g_Log->m_logLevel;
}

void setGlobalLogLevel(Level level) {
	g_Log->setLevel(level);
}

Level parseLogLevel(const char* slevel) {
	auto level = std::string(slevel);
	if (level == "quiet") {
		return Quiet;
	} else if (level == "error") {
		return Error;
	} else if (level == "warning") {
		return Warning;
	} else if (level == "info") {
		return Info;
	} else if (level == "debug") {
		return Debug;
	} else
		throw std::runtime_error("Unknown log level: " + level);
}
