#pragma once

#include <filesystem>

int RemovePreviousInstall(const std::filesystem::path &binary);

/**
 * chmod u+x, then checks the file can actually be executed (noexec mounts
 * let the chmod succeed without making the file runnable).
 */
int MakeExecutable(const std::filesystem::path &file);
int CheckExecutable(const std::filesystem::path &file);

int MoveFile(const std::filesystem::path &from, const std::filesystem::path &to);

int InstallBinary(const std::filesystem::path &file, const std::filesystem::path &directory);
