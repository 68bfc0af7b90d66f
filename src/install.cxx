#include <install.hxx>
#include <log.hxx>

#include <cerrno>
#include <cstring>

#include <unistd.h>

int RemovePreviousInstall(const std::filesystem::path &binary)
{
    std::error_code error;
    if (!std::filesystem::is_regular_file(binary, error) && !std::filesystem::is_symlink(binary, error))
    {
        return 0;
    }

    std::filesystem::remove(binary, error);
    if (error)
    {
        Error("failed to remove ", binary.string(), ": ", error.message());
        return 1;
    }

    Info("Removed old version of ", binary.filename().string());
    return 0;
}

int MakeExecutable(const std::filesystem::path &file)
{
    std::error_code error;
    std::filesystem::permissions(file, std::filesystem::perms::owner_exec, std::filesystem::perm_options::add, error);
    if (error)
    {
        Error("command failed: chmod u+x ", file.string(), ": ", error.message());
        return 1;
    }

    return CheckExecutable(file);
}

int CheckExecutable(const std::filesystem::path &file)
{
    if (access(file.c_str(), X_OK))
    {
        Debug("access ", file.string(), ": ", std::strerror(errno));
        Error("Cannot execute ", file.string());
        Error("Please copy the file to a location where the binary can be executed.");
        return 1;
    }

    return 0;
}

int MoveFile(const std::filesystem::path &from, const std::filesystem::path &to)
{
    std::error_code error;
    std::filesystem::rename(from, to, error);
    if (!error)
    {
        return 0;
    }

    if (error != std::errc::cross_device_link)
    {
        Error("command failed: mv ", from.string(), " ", to.string(), ": ", error.message());
        return 1;
    }

    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, error);
    if (error)
    {
        Error("failed to copy ", from.string(), " to ", to.string(), ": ", error.message());
        return 1;
    }

    std::filesystem::remove(from, error);
    if (error)
    {
        Error("failed to remove ", from.string(), ": ", error.message());
        return 1;
    }

    return 0;
}

int InstallBinary(const std::filesystem::path &file, const std::filesystem::path &directory)
{
    if (const auto error = MakeExecutable(file))
    {
        return error;
    }

    std::error_code error;
    std::filesystem::create_directories(directory, error);
    if (error)
    {
        Error("command failed: mkdir -p ", directory.string(), ": ", error.message());
        return 1;
    }

    const auto target = directory / file.filename();

    if (const auto remove_error = RemovePreviousInstall(target))
    {
        return remove_error;
    }

    if (const auto move_error = MoveFile(file, target))
    {
        return move_error;
    }

    return 0;
}
