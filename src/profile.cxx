#include <log.hxx>
#include <profile.hxx>
#include <util.hxx>

#include <fstream>
#include <map>

static const std::map<std::string_view, Shell> shell_map
{
    { "zsh", Shell::Zsh },
    { "bash", Shell::Bash },
    { "fish", Shell::Fish },
    { "ash", Shell::Ash },
};

std::optional<ShellProfile> DetectShell(const std::string_view shell,
                                        const std::filesystem::path &home,
                                        const std::string_view zdotdir)
{
    const auto name = std::filesystem::path(shell).filename().string();

    const auto it = shell_map.find(name);
    if (it == shell_map.end())
    {
        return std::nullopt;
    }

    switch (it->second)
    {
    case Shell::Zsh:
        return ShellProfile{ Shell::Zsh, (zdotdir.empty() ? home : std::filesystem::path(zdotdir)) / ".zshenv" };
    case Shell::Bash:
        return ShellProfile{ Shell::Bash, home / ".bashrc" };
    case Shell::Fish:
        return ShellProfile{ Shell::Fish, home / ".config" / "fish" / "config.fish" };
    case Shell::Ash:
        return ShellProfile{ Shell::Ash, home / ".profile" };
    }

    return std::nullopt;
}

bool IsOnPath(const std::string_view path, const std::filesystem::path &directory)
{
    const auto target = directory.string();
    for (auto &segment : Split(path, ':'))
    {
        if (segment == target)
        {
            return true;
        }
    }
    return false;
}

std::string GetPathLine(const Shell shell, const std::filesystem::path &directory)
{
    if (shell == Shell::Fish)
    {
        return "set -x PATH $PATH " + directory.string();
    }

    return "export PATH=\"$PATH:" + directory.string() + "\"";
}

int AppendLine(const std::filesystem::path &file, const std::string_view line)
{
    std::error_code error;
    if (file.has_parent_path())
    {
        std::filesystem::create_directories(file.parent_path(), error);
        if (error)
        {
            Error("failed to create ", file.parent_path().string(), ": ", error.message());
            return 1;
        }
    }

    std::ofstream stream(file, std::ios::app);
    if (!stream)
    {
        Error("failed to open ", file.string(), " for writing");
        return 1;
    }

    stream << line << '\n';
    stream.close();

    if (!stream)
    {
        Error("failed to write ", file.string());
        return 1;
    }

    return 0;
}

std::ostream &operator<<(std::ostream &stream, const Shell shell)
{
    static const std::map<Shell, const char *> map = {
        { Shell::Zsh, "zsh" },
        { Shell::Bash, "bash" },
        { Shell::Fish, "fish" },
        { Shell::Ash, "ash" },
    };

    return stream << map.at(shell);
}
