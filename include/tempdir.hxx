#pragma once

#include <filesystem>
#include <string_view>

class TempDirectory
{
public:
    TempDirectory() = default;
    ~TempDirectory();

    TempDirectory(const TempDirectory &) = delete;
    TempDirectory &operator=(const TempDirectory &) = delete;

    int Create(const std::filesystem::path &parent, std::string_view prefix);
    void Remove();

    [[nodiscard]] const std::filesystem::path &Path() const { return m_Path; }

private:
    std::filesystem::path m_Path;
};

// removed on exit() and on SIGINT, SIGTERM, SIGHUP or SIGQUIT
int TrackCleanup(const std::filesystem::path &path);
void UntrackCleanup(const std::filesystem::path &path);
void CleanupTracked();
