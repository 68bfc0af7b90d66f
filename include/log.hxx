#pragma once

#include <iostream>
#include <utility>

enum class LogLevel
{
    Debug,
    Info,
    Warn,
    Error,
};

void ConfigureLog(bool quiet, bool verbose, bool ansi);

bool IsLogEnabled(LogLevel level);

bool SupportsAnsi(const char *term, bool is_tty);

std::ostream &LogPrefix(std::ostream &stream, LogLevel level);

template <typename... Args>
void Log(const LogLevel level, Args &&...args)
{
    if (!IsLogEnabled(level))
        return;

    LogPrefix(std::cerr, level);
    (std::cerr << ... << std::forward<Args>(args));
    std::cerr << std::endl;
}

template <typename... Args>
void Debug(Args &&...args)
{
    Log(LogLevel::Debug, std::forward<Args>(args)...);
}

template <typename... Args>
void Info(Args &&...args)
{
    Log(LogLevel::Info, std::forward<Args>(args)...);
}

template <typename... Args>
void Warn(Args &&...args)
{
    Log(LogLevel::Warn, std::forward<Args>(args)...);
}

template <typename... Args>
void Error(Args &&...args)
{
    Log(LogLevel::Error, std::forward<Args>(args)...);
}

template <typename... Args>
int Assert(const bool exp, Args &&...args)
{
    if (exp)
        return 0;

    Error(std::forward<Args>(args)...);
    return 1;
}
