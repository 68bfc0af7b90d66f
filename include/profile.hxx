#pragma once

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

enum class Shell
{
    Zsh,
    Bash,
    Fish,
    Ash,
};

struct ShellProfile
{
    Shell Kind;
    std::filesystem::path Path;
};

/**
 * Picks the profile file from the last path component of `$SHELL`.
 * zsh honours `$ZDOTDIR` (pass an empty view when unset).
 */
std::optional<ShellProfile> DetectShell(std::string_view shell,
                                        const std::filesystem::path &home,
                                        std::string_view zdotdir);

bool IsOnPath(std::string_view path, const std::filesystem::path &directory);

std::string GetPathLine(Shell shell, const std::filesystem::path &directory);

int AppendLine(const std::filesystem::path &file, std::string_view line);

// `profile` stays empty when the shell is not recognized
int AppendUserPath(const std::filesystem::path &directory, std::optional<std::filesystem::path> &profile);

std::ostream &operator<<(std::ostream &stream, Shell shell);
