#pragma once

enum Level {
	Quiet = -1,
	Error = 0,
	Warning,
	Info,
	Debug
};

struct LogSink {
		virtual ~LogSink() = default;

		void log(Level level, const char* msg) {
			if ((level != Quiet) && (level <= m_logLevel))
				send(level, msg);
		}

		bool enabled(Level level) const {
			return (level != Quiet) && (level <= m_logLevel);
		}

		void setLevel(Level level) {
			m_logLevel = level;
		}

		Level m_logLevel = Warning;

	private:
		virtual void send(Level level, const char* msg) = 0;
};
