#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

std::optional<std::filesystem::path> FindCommand(std::string_view name, std::string_view path);
std::optional<std::filesystem::path> FindCommand(std::string_view name);

bool CheckCommand(std::string_view name);
int NeedCommand(std::string_view name);

/**
 * Runs `args` to completion with stdin on /dev/null. Everything the command
 * writes to stdout and stderr is collected in `output`; `status` receives the
 * exit code (128 + signal number if the command was killed).
 */
int RunCommand(const std::vector<std::string> &args, std::string &output, int &status);

std::string JoinCommand(const std::vector<std::string> &args);
