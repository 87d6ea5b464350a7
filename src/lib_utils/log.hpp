#pragma once

#include "log_sink.hpp"
#include "format.hpp"
#include <string>

extern LogSink* g_Log;

void setGlobalLogConsole(bool color_enable);
void setGlobalLogCSV(const char* path);

// 'sink' must outlive any later logging. Pass nullptr to go back to the console.
void setGlobalLogSink(LogSink* sink);

Level getGlobalLogLevel();
void setGlobalLogLevel(Level level);

Level parseLogLevel(const char* slevel);

// logs "[component] message", formatting is skipped when the level is filtered out
template<typename... Arguments>
void logMsg(Level level, const char* component, const std::string& fmt, Arguments... args) {
	if (!g_Log->enabled(level))
		return;
	g_Log->log(level, format("[%s] %s", component, format(fmt, args...)).c_str());
}
