#if defined(SYSTEM_LINUX) || defined(SYSTEM_DARWIN)

#include <log.hxx>
#include <util.hxx>

#include <cstdlib>

std::optional<std::filesystem::path> GetHomeDirectory()
{
    const auto home = std::getenv("HOME");
    if (!home || !*home)
        return std::nullopt;

    return std::filesystem::path(home);
}

int GetBinaryDirectory(std::filesystem::path &directory)
{
    const auto home = GetHomeDirectory();
    if (!home.has_value())
    {
        Error("HOME is not set, cannot locate the binary directory");
        return 1;
    }

    directory = home.value() / ".cargo" / "bin";
    return 0;
}

#endif
