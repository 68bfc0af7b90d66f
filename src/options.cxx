#include <options.hxx>

#include <map>

#include <version.h>

constexpr auto HELP_BITS = 0b0001u;
constexpr auto VERBOSE_BITS = 0b0010u;
constexpr auto QUIET_BITS = 0b0100u;
constexpr auto YES_BITS = 0b1000u;

static const std::map<std::string_view, unsigned> option_map
{
    { "-h", HELP_BITS },
    { "--help", HELP_BITS },
    { "-v", VERBOSE_BITS },
    { "--verbose", VERBOSE_BITS },
    { "-q", QUIET_BITS },
    { "--quiet", QUIET_BITS },
    { "-y", YES_BITS },
    { "--yes", YES_BITS },
};

Options ParseOptions(const std::vector<std::string_view> &args)
{
    unsigned bits = 0;
    for (auto &arg : args)
    {
        if (const auto it = option_map.find(arg); it != option_map.end())
        {
            bits |= it->second;
        }
    }

    return {
        .Help = (bits & HELP_BITS) != 0,
        .Verbose = (bits & VERBOSE_BITS) != 0,
        .Quiet = (bits & QUIET_BITS) != 0,
        .AssumeYes = (bits & YES_BITS) != 0,
    };
}

void PrintUsage(std::ostream &stream)
{
    stream
            << PROJECT_NAME << "\n"
            << "\n"
            << "The installer for rzup from RISC Zero.\n"
            << "\n"
            << "  Version:    " << PROJECT_VERSION << "\n"
            << "  Build date: " << PROJECT_BUILD_DATE << "\n"
            << "\n"
            << "Usage: " << PROJECT_NAME << " [OPTIONS]\n"
            << "\n"
            << "Options:\n"
            << "  -v, --verbose\n"
            << "          Enable verbose output\n"
            << "  -q, --quiet\n"
            << "          Disable progress output\n"
            << "  -y, --yes\n"
            << "          Disable confirmation prompt\n"
            << "  -h, --help\n"
            << "          Print help\n"
            << "\n"
            << "Environment:\n"
            << "  RZUP_BINARY_UPDATE_ROOT   Base URL the rzup binary is downloaded from\n"
            << "  RZUP_DOWNLOADER           auto (default), curl, wget or native\n"
            << std::endl;
}
