#include <command.hxx>
#include <download.hxx>
#include <http.hxx>
#include <log.hxx>
#include <url.hxx>
#include <util.hxx>

#include <fstream>
#include <map>
#include <vector>

static const std::map<std::string_view, DownloaderKind> downloader_map
{
    { "auto", DownloaderKind::Auto },
    { "curl", DownloaderKind::Curl },
    { "wget", DownloaderKind::Wget },
    { "native", DownloaderKind::Native },
};

static int run_downloader(const std::vector<std::string> &args)
{
    std::string output;
    int status;
    if (const auto error = RunCommand(args, output, status))
    {
        return error;
    }

    // the tools run silently on success; anything they print is the failure
    if (auto message = Trim(output); !message.empty())
    {
        Error(message);
        return 1;
    }

    if (status)
    {
        Error("command failed: ", JoinCommand(args));
        return 1;
    }

    return 0;
}

static int download_native(const std::string &url, const std::filesystem::path &file)
{
    http::HttpRequest request{
        .Method = http::HttpMethod::Get,
    };

    if (!http::ParseUrl(request.Location, url))
    {
        Error("invalid download url '", url, "'");
        return 1;
    }

    std::ofstream stream(file, std::ios::binary | std::ios::trunc);
    if (!stream)
    {
        Error("failed to open ", file.string(), " for writing");
        return 1;
    }

    http::HttpResponse response{
        .Body = &stream,
    };

    http::HttpClient client;
    if (const auto error = client.Request(request, response))
    {
        Error("failed to download ", url);
        return error;
    }

    if (!response.ok())
    {
        Error("HTTP ", response.StatusCode, " ", response.StatusMessage, ": ", url);
        return 1;
    }

    stream.close();
    if (!stream)
    {
        Error("failed to write ", file.string());
        return 1;
    }

    return 0;
}

int ParseDownloaderKind(const std::string_view name, DownloaderKind &kind)
{
    const auto it = downloader_map.find(Lower(std::string(name)));
    if (it == downloader_map.end())
    {
        Error("unknown downloader '", name, "', expected one of auto, curl, wget, native");
        return 1;
    }

    kind = it->second;
    return 0;
}

int CheckDownloader(const DownloaderKind requested, DownloaderKind &selected)
{
    switch (requested)
    {
    case DownloaderKind::Auto:
        if (CheckCommand("curl"))
        {
            selected = DownloaderKind::Curl;
            return 0;
        }
        if (CheckCommand("wget"))
        {
            selected = DownloaderKind::Wget;
            return 0;
        }
        Error("need 'curl' or 'wget' (neither found)");
        return 1;

    case DownloaderKind::Curl:
        if (const auto error = NeedCommand("curl"))
            return error;
        break;

    case DownloaderKind::Wget:
        if (const auto error = NeedCommand("wget"))
            return error;
        break;

    case DownloaderKind::Native:
        break;
    }

    selected = requested;
    return 0;
}

int Download(const DownloaderKind kind, const std::string &url, const std::filesystem::path &file)
{
    Debug("downloading ", url, " with ", kind);

    switch (kind)
    {
    case DownloaderKind::Curl:
        return run_downloader({ "curl", "--silent", "--show-error", "--fail", "--location", url, "--output", file.string() });

    case DownloaderKind::Wget:
        return run_downloader({ "wget", "--quiet", "--output-document=" + file.string(), url });

    case DownloaderKind::Native:
        return download_native(url, file);

    default:
        Error("need 'curl' or 'wget' (neither command found)");
        return 1;
    }
}

std::ostream &operator<<(std::ostream &stream, const DownloaderKind kind)
{
    static const std::map<DownloaderKind, const char *> map = {
        { DownloaderKind::Auto, "auto" },
        { DownloaderKind::Curl, "curl" },
        { DownloaderKind::Wget, "wget" },
        { DownloaderKind::Native, "native" },
    };

    return stream << map.at(kind);
}
