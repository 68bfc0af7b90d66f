#include <command.hxx>
#include <config.hxx>
#include <download.hxx>
#include <install.hxx>
#include <log.hxx>
#include <options.hxx>
#include <platform.hxx>
#include <profile.hxx>
#include <tempdir.hxx>
#include <unpack.hxx>
#include <util.hxx>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <unistd.h>

static const std::vector<std::string_view> required_commands
{
    "uname",
    "mktemp",
    "chmod",
    "mkdir",
    "rm",
    "rmdir",
    "mv",
};

static int check_rust_installed()
{
    return Assert(
        CheckCommand("rustc"),
        "Rust is not installed. Please install Rust from https://rustup.rs/ and run this script again.");
}

static int preflight(const Config &config, DownloaderKind &downloader)
{
    if (const auto error = CheckDownloader(config.Downloader, downloader))
    {
        return error;
    }

    for (auto &command : required_commands)
    {
        if (const auto error = NeedCommand(command))
        {
            return error;
        }
    }

    return check_rust_installed();
}

static int confirm(const Options &options, const Config &config)
{
    if (options.AssumeYes || !isatty(STDIN_FILENO))
    {
        return 0;
    }

    std::cerr
            << TOOL_NAME << " will be installed to " << config.BinaryDirectory.string() << ".\n"
            << "Continue? [Y/n] " << std::flush;

    std::string answer;
    if (!std::getline(std::cin, answer))
    {
        Error("no answer given, run with --yes to skip the confirmation prompt");
        return 1;
    }

    answer = Lower(Trim(std::move(answer)));
    if (answer.empty() || answer == "y" || answer == "yes")
    {
        return 0;
    }

    Error("installation aborted");
    return 1;
}

static void report(const std::optional<std::filesystem::path> &profile)
{
    Info("\U0001F389 ", TOOL_NAME, " installed!");

    std::cout << "Run the following commands to install the zkVM:\n";
    if (profile.has_value())
    {
        std::cout << "  source " << profile->string() << "\n";
    }
    std::cout << "  " << TOOL_NAME << " install" << std::endl;
}

static int execute(const std::vector<std::string_view> &args)
{
    const auto options = ParseOptions(args);
    if (options.Help)
    {
        PrintUsage(std::cout);
        return 0;
    }

    ConfigureLog(options.Quiet, options.Verbose, SupportsAnsi(std::getenv("TERM"), isatty(STDERR_FILENO)));

    Config config;
    if (const auto error = LoadConfig(config))
    {
        return error;
    }

    DownloaderKind downloader{};
    if (const auto error = preflight(config, downloader))
    {
        return error;
    }

    std::string arch;
    if (const auto error = GetHostArchitecture(arch))
    {
        return error;
    }

    const auto url = GetDownloadUrl(config);
    Debug("architecture: ", arch);
    Debug("download url: ", url);

    if (const auto error = confirm(options, config))
    {
        return error;
    }

    std::error_code temp_error;
    const auto temp_root = std::filesystem::temp_directory_path(temp_error);
    if (temp_error)
    {
        Error("failed to locate the temporary directory: ", temp_error.message());
        return 1;
    }

    TempDirectory directory;
    if (const auto error = directory.Create(temp_root, "rzup-init."))
    {
        return error;
    }

    const auto file = directory.Path() / TOOL_NAME;

    Info("Downloading installer");

    if (const auto error = Download(downloader, url, file))
    {
        return error;
    }

    std::filesystem::path binary;
    if (const auto error = UnpackArtifact(file, TOOL_NAME, directory.Path() / "unpacked", binary))
    {
        return error;
    }

    if (const auto error = InstallBinary(binary, config.BinaryDirectory))
    {
        return error;
    }

    Info(TOOL_NAME, " has been installed to ", config.BinaryDirectory.string());

    std::optional<std::filesystem::path> profile;
    if (const auto error = AppendUserPath(config.BinaryDirectory, profile))
    {
        return error;
    }

    report(profile);
    return 0;
}

int main(const int argc, const char *const *argv)
{
    return execute({ argv + 1, argv + argc }) ? 1 : 0;
}
