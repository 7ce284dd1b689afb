/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

logger.cpp implementation.*/

#include "logger.hpp"

#include <array>
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace mmq {
namespace {

using Sink = std::function<void(std::string_view)>;

struct LevelEntry {
	LogLevel level;
	std::string_view label;
	std::string_view alias;
};

// Ordered from most to least verbose; the index is the level's weight.
constexpr std::array<LevelEntry, 5> kLevels{ {
	{ LogLevel::Trace, "TRACE", "" },
	{ LogLevel::Debug, "DEBUG", "" },
	{ LogLevel::Info, "INFO", "" },
	{ LogLevel::Warn, "WARN", "WARNING" },
	{ LogLevel::Error, "ERROR", "" },
} };

constexpr LogLevel kDefaultLevel = LogLevel::Warn;

// Everything InitLogger installs. Replaced whole so Log can hold a copy
// without keeping the lock while a sink runs.
struct Route {
	std::string module_name = "mmq";
	Sink print_sink;
	Sink error_sink;
};

std::mutex route_mutex;
std::shared_ptr<const Route> route = std::make_shared<const Route>();
std::atomic<LogLevel> threshold{ kDefaultLevel };

std::shared_ptr<const Route> CurrentRoute()
{
	std::lock_guard lock(route_mutex);
	return route;
}

bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs)
{
	if (lhs.size() != rhs.size())
		return false;

	for (size_t i = 0; i < lhs.size(); ++i) {
		char c = lhs[i];
		if (c >= 'a' && c <= 'z')
			c = static_cast<char>(c - 'a' + 'A');
		if (c != rhs[i])
			return false;
	}
	return true;
}

void Emit(const Sink& sink, std::FILE* fallback, const std::string& line)
{
	if (sink) {
		sink(line);
		return;
	}
	std::fputs(line.c_str(), fallback);
}

} // namespace

/*
=============
ParseLogLevel

Unknown names fall back to the default level.
=============
*/
LogLevel ParseLogLevel(std::string_view value)
{
	for (const LevelEntry& entry : kLevels) {
		if (EqualsIgnoreCase(value, entry.label) || (!entry.alias.empty() && EqualsIgnoreCase(value, entry.alias)))
			return entry.level;
	}
	return kDefaultLevel;
}

LogLevel ReadLogLevelFromEnv()
{
	const char* value = std::getenv("MMQ_LOG_LEVEL");
	return value ? ParseLogLevel(value) : kDefaultLevel;
}

int LevelWeight(LogLevel level)
{
	for (size_t i = 0; i < kLevels.size(); ++i) {
		if (kLevels[i].level == level)
			return static_cast<int>(i);
	}
	return static_cast<int>(kLevels.size() - 1);
}

const char* LogLevelLabel(LogLevel level)
{
	return kLevels[static_cast<size_t>(LevelWeight(level))].label.data();
}

/*
=============
FormatMessage

One line: `[MMQ][module] [LEVEL] text`, always newline-terminated.
=============
*/
std::string FormatMessage(LogLevel level, std::string_view module_name, std::string_view message)
{
	std::string line = std::format("[MMQ][{}] [{}] {}", module_name, LogLevelLabel(level), message);
	if (line.back() != '\n')
		line.push_back('\n');
	return line;
}

/*
=============
InitLogger

Installs the module tag and sinks, then reloads the level from the
environment. A null sink sends its lines to stdout or stderr.
=============
*/
void InitLogger(std::string_view module_name, std::function<void(std::string_view)> print_sink, std::function<void(std::string_view)> error_sink)
{
	auto next = std::make_shared<Route>();
	next->module_name = std::string(module_name);
	next->print_sink = std::move(print_sink);
	next->error_sink = std::move(error_sink);

	{
		std::lock_guard lock(route_mutex);
		route = std::move(next);
	}
	threshold.store(ReadLogLevelFromEnv(), std::memory_order_relaxed);
}

void SetLogLevel(LogLevel level)
{
	threshold.store(level, std::memory_order_relaxed);
}

LogLevel GetLogLevel()
{
	return threshold.load(std::memory_order_relaxed);
}

bool IsLogLevelEnabled(LogLevel level)
{
	return LevelWeight(level) >= LevelWeight(GetLogLevel());
}

/*
=============
Log

Errors reach the error sink at any threshold; every enabled level also goes
to the print sink.
=============
*/
void Log(LogLevel level, std::string_view message)
{
	const bool printed = IsLogLevelEnabled(level);
	const bool is_error = level == LogLevel::Error;
	if (!printed && !is_error)
		return;

	const std::shared_ptr<const Route> current = CurrentRoute();
	const std::string line = FormatMessage(level, current->module_name, message);

	// without sinks an error line goes to stderr only
	if (printed && (current->print_sink || !is_error))
		Emit(current->print_sink, stdout, line);
	if (is_error)
		Emit(current->error_sink, stderr, line);
}

} // namespace mmq
