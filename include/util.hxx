#pragma once

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

std::optional<std::filesystem::path> GetHomeDirectory();

int GetBinaryDirectory(std::filesystem::path &directory);

std::istream &GetLine(std::istream &stream, std::string &string, const std::string_view &delim);

std::string Trim(std::string string);
std::string Lower(std::string string);

std::vector<std::string> Split(std::string_view string, char delim);
