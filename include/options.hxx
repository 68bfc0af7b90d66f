#pragma once

#include <ostream>
#include <string_view>
#include <vector>

struct Options
{
    bool Help{};
    bool Verbose{};
    bool Quiet{};
    bool AssumeYes{};
};

Options ParseOptions(const std::vector<std::string_view> &args);

void PrintUsage(std::ostream &stream);
