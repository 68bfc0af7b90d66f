#if defined(SYSTEM_LINUX) || defined(SYSTEM_DARWIN)

#include <config.hxx>
#include <log.hxx>
#include <profile.hxx>
#include <util.hxx>

#include <cstdlib>

static std::string_view get_env(const char *name)
{
    const auto value = std::getenv(name);
    return value ? value : "";
}

int AppendUserPath(const std::filesystem::path &directory, std::optional<std::filesystem::path> &profile)
{
    profile.reset();

    const auto home = GetHomeDirectory();
    if (!home.has_value())
    {
        Error("HOME is not set, cannot locate the shell profile");
        return 1;
    }

    const auto detected = DetectShell(get_env("SHELL"), home.value(), get_env("ZDOTDIR"));
    if (!detected.has_value())
    {
        Warn("Could not detect shell, manually add ", directory.string(), " to your PATH.");
        return 0;
    }

    auto &[shell, path] = detected.value();
    Info("Detected your preferred shell as ", shell);

    profile = path;

    // only the live PATH is consulted, the profile itself is not searched
    if (IsOnPath(get_env("PATH"), directory))
    {
        Info(TOOL_NAME, " is already in your PATH");
        return 0;
    }

    Info("Adding ", TOOL_NAME, " to PATH in ", path.string());

    if (const auto error = AppendLine(path, GetPathLine(shell, directory)))
    {
        return error;
    }

    Info("Run the following commands to update your shell:");
    Info("source ", path.string());
    Info(TOOL_NAME);
    return 0;
}

#endif
