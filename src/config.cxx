#include <config.hxx>
#include <log.hxx>
#include <util.hxx>

#include <cstdlib>

int LoadConfig(Config &config)
{
    const auto update_root = std::getenv("RZUP_BINARY_UPDATE_ROOT");
    config.UpdateRoot = update_root && *update_root ? update_root : DEFAULT_UPDATE_ROOT;

    config.Downloader = DownloaderKind::Auto;
    if (const auto downloader = std::getenv("RZUP_DOWNLOADER"); downloader && *downloader)
    {
        if (const auto error = ParseDownloaderKind(downloader, config.Downloader))
        {
            return error;
        }
    }

    return GetBinaryDirectory(config.BinaryDirectory);
}

std::string GetDownloadUrl(const Config &config)
{
    auto root = config.UpdateRoot;
    while (!root.empty() && root.back() == '/')
    {
        root.pop_back();
    }

    return root + "/" + TOOL_NAME;
}
