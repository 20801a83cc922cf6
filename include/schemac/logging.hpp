#pragma once
#include <functional>
#include <string>

namespace schemac::log
{

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

using LogCallback = std::function<void(LogLevel, const std::string&)>;

const char* to_string(LogLevel level);

/// Parses "DEBUG", "INFO", "WARN"/"WARNING", "ERROR" (any case). Unknown names map to Info.
LogLevel level_from_string(const std::string& name);

/// Replaces the sink. Passing nullptr restores the default stderr writer.
void set_callback(LogCallback callback);

/// Messages below `level` are dropped before reaching the sink.
void set_level(LogLevel level);
LogLevel level();

void write(LogLevel level, const std::string& message);

inline void debug(const std::string& message)
{
    write(LogLevel::Debug, message);
}

inline void info(const std::string& message)
{
    write(LogLevel::Info, message);
}

inline void warning(const std::string& message)
{
    write(LogLevel::Warning, message);
}

inline void error(const std::string& message)
{
    write(LogLevel::Error, message);
}

} // namespace schemac::log
