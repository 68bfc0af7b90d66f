#pragma once

#include <download.hxx>

#include <filesystem>
#include <string>

constexpr auto TOOL_NAME = "rzup";
constexpr auto DEFAULT_UPDATE_ROOT = "https://github.com/hmrtn/asset-test/releases/download/test1/";

struct Config
{
    std::string UpdateRoot;
    std::filesystem::path BinaryDirectory;
    DownloaderKind Downloader{};
};

int LoadConfig(Config &config);

std::string GetDownloadUrl(const Config &config);
