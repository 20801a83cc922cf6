#include "schemac/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <utility>

namespace schemac::log
{
namespace
{

void default_sink(LogLevel level, const std::string& message)
{
    std::cerr << "[schemac] " << to_string(level) << " " << message << std::endl;
}

LogCallback& callback_ref()
{
    static LogCallback callback = default_sink;
    return callback;
}

LogLevel& level_ref()
{
    static LogLevel level = LogLevel::Info;
    return level;
}

} // namespace

const char* to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

LogLevel level_from_string(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
    if (upper == "DEBUG")
        return LogLevel::Debug;
    if (upper == "WARN" || upper == "WARNING")
        return LogLevel::Warning;
    if (upper == "ERROR")
        return LogLevel::Error;
    return LogLevel::Info;
}

void set_callback(LogCallback callback)
{
    callback_ref() = callback ? std::move(callback) : LogCallback(default_sink);
}

void set_level(LogLevel level)
{
    level_ref() = level;
}

LogLevel level()
{
    return level_ref();
}

void write(LogLevel level, const std::string& message)
{
    if (level < level_ref())
        return;
    if (auto& cb = callback_ref())
        cb(level, message);
}

} // namespace schemac::log
