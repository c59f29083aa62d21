#pragma once
#include <string>

enum class LogLevel { Quiet, Normal, Verbose };

// Console log shared by every worker thread. Lines look like
// "[Tag] message"; whole lines are written under one lock so concurrent
// transfers never interleave mid-line.
class Log {
public:
    static void setLevel(LogLevel level);
    static LogLevel level();
    static bool isVerbose();

    static void info(const std::string& tag, const std::string& message);
    static void verbose(const std::string& tag, const std::string& message);
    static void warn(const std::string& tag, const std::string& message);
    static void error(const std::string& tag, const std::string& message);
};
