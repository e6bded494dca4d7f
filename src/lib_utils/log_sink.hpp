#pragma once

enum Level {
	Quiet = -1,
	Error = 0,
	Warning,
	Info,
	Debug
};

inline const char* levelName(Level level) {
	switch(level) {
	case Error: return "error";
	case Warning: return "warning";
	case Info: return "info";
	case Debug: return "debug";
	default: return "quiet";
	}
}

struct LogSink {
		virtual ~LogSink() = default;

		void log(Level level, const char* msg) {
			if (isEnabled(level))
				send(level, msg);
		}

		bool isEnabled(Level level) const {
			return (level != Quiet) && (level <= m_logLevel);
		}

		void setLevel(Level level) {
			m_logLevel = level;
		}

		Level m_logLevel = Warning;

	private:
		virtual void send(Level level, const char* msg) = 0;
};
