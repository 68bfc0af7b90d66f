#include <log.hxx>

#include <map>
#include <string_view>

static struct
{
    bool Quiet{};
    bool Verbose{};
    bool Ansi{};
} log_state;

void ConfigureLog(const bool quiet, const bool verbose, const bool ansi)
{
    log_state.Quiet = quiet;
    log_state.Verbose = verbose;
    log_state.Ansi = ansi;
}

bool IsLogEnabled(const LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return log_state.Verbose && !log_state.Quiet;
    case LogLevel::Info:
        return !log_state.Quiet;
    default:
        return true;
    }
}

bool SupportsAnsi(const char *term, const bool is_tty)
{
    if (!is_tty || !term)
        return false;

    const std::string_view name(term);
    for (const auto prefix : { "xterm", "rxvt", "urxvt", "linux", "vt" })
    {
        if (name.starts_with(prefix))
            return true;
    }

    return false;
}

std::ostream &LogPrefix(std::ostream &stream, const LogLevel level)
{
    struct Prefix
    {
        const char *Label;
        const char *Color;
    };

    static const std::map<LogLevel, Prefix> map = {
        { LogLevel::Debug, { "debug", "\033[2m" } },
        { LogLevel::Info, { "info", "\033[1m" } },
        { LogLevel::Warn, { "warn", "\033[1;33m" } },
        { LogLevel::Error, { "error", "\033[1;31m" } },
    };

    auto &[label, color] = map.at(level);

    if (log_state.Ansi)
        return stream << color << label << ":\033[0m ";

    return stream << label << ": ";
}
