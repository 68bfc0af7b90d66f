#pragma once

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>

enum class DownloaderKind
{
    Auto,
    Curl,
    Wget,
    Native,
};

int ParseDownloaderKind(std::string_view name, DownloaderKind &kind);

int CheckDownloader(DownloaderKind requested, DownloaderKind &selected);

/**
 * Fetches `url` into `file`. For curl and wget, any output the tool prints is
 * treated as the failure message, whatever its exit status.
 */
int Download(DownloaderKind kind, const std::string &url, const std::filesystem::path &file);

std::ostream &operator<<(std::ostream &stream, DownloaderKind kind);
