/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

logger.hpp declarations.*/

#pragma once

#include <format>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace mmq {

enum class LogLevel {
	Trace,
	Debug,
	Info,
	Warn,
	Error
};

LogLevel ParseLogLevel(std::string_view value);
LogLevel ReadLogLevelFromEnv();
int LevelWeight(LogLevel level);
std::string FormatMessage(LogLevel level, std::string_view module_name, std::string_view message);

void InitLogger(std::string_view module_name, std::function<void(std::string_view)> print_sink, std::function<void(std::string_view)> error_sink);
void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();
bool IsLogLevelEnabled(LogLevel level);

void Log(LogLevel level, std::string_view message);
const char* LogLevelLabel(LogLevel level);

/*
=============
Logf

Format and log a message, skipping the formatting work when the level is disabled.
=============
*/
template <typename... Args>
void Logf(LogLevel level, std::format_string<Args...> fmt, Args&&... args)
{
	if (!IsLogLevelEnabled(level))
		return;

	Log(level, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace mmq
