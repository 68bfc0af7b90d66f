#if defined(SYSTEM_LINUX) || defined(SYSTEM_DARWIN)

#include <command.hxx>
#include <log.hxx>
#include <util.hxx>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

static bool is_executable_file(const std::filesystem::path &path)
{
    std::error_code error;
    if (!std::filesystem::is_regular_file(path, error))
        return false;

    return !access(path.c_str(), X_OK);
}

std::optional<std::filesystem::path> FindCommand(const std::string_view name, const std::string_view path)
{
    if (name.empty())
        return std::nullopt;

    if (name.find('/') != std::string_view::npos)
    {
        if (is_executable_file(name))
            return std::filesystem::path(name);
        return std::nullopt;
    }

    for (auto &segment : Split(path, ':'))
    {
        auto candidate = (segment.empty() ? std::filesystem::path(".") : std::filesystem::path(segment)) / name;
        if (is_executable_file(candidate))
            return candidate;
    }

    return std::nullopt;
}

std::optional<std::filesystem::path> FindCommand(const std::string_view name)
{
    const auto path = std::getenv("PATH");
    return FindCommand(name, path ? path : "");
}

bool CheckCommand(const std::string_view name)
{
    return FindCommand(name).has_value();
}

int NeedCommand(const std::string_view name)
{
    return Assert(CheckCommand(name), "need '", name, "' (command not found)");
}

int RunCommand(const std::vector<std::string> &args, std::string &output, int &status)
{
    if (args.empty())
    {
        Error("no command to run");
        return 1;
    }

    // argv is built before forking; the child only execs or reports failure
    std::vector<char *> argv;
    for (auto &arg : args)
        argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    const auto exec_failed = args.front() + ": failed to execute\n";

    int fds[2];
    if (pipe(fds))
    {
        Error("failed to create pipe: ", std::strerror(errno));
        return 1;
    }

    // the parent's cleanup handlers must never run in the child
    sigset_t blocked, previous;
    sigemptyset(&blocked);
    for (const auto sig : { SIGINT, SIGTERM, SIGHUP, SIGQUIT })
        sigaddset(&blocked, sig);
    sigprocmask(SIG_BLOCK, &blocked, &previous);

    const auto pid = fork();
    if (pid < 0)
    {
        Error("failed to fork: ", std::strerror(errno));
        sigprocmask(SIG_SETMASK, &previous, nullptr);
        close(fds[0]);
        close(fds[1]);
        return 1;
    }

    if (pid == 0)
    {
        for (const auto sig : { SIGINT, SIGTERM, SIGHUP, SIGQUIT })
            std::signal(sig, SIG_DFL);
        sigprocmask(SIG_SETMASK, &previous, nullptr);

        if (const auto null = open("/dev/null", O_RDONLY); null >= 0)
        {
            dup2(null, STDIN_FILENO);
            close(null);
        }

        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        close(fds[0]);
        close(fds[1]);

        execvp(argv[0], argv.data());

        [[maybe_unused]] const auto written = write(STDERR_FILENO, exec_failed.data(), exec_failed.size());
        _exit(127);
    }

    sigprocmask(SIG_SETMASK, &previous, nullptr);
    close(fds[1]);

    output.clear();

    char buf[4096];
    while (true)
    {
        const auto len = read(fds[0], buf, sizeof(buf));
        if (len == 0)
            break;

        if (len < 0)
        {
            if (errno == EINTR)
                continue;

            Error("failed to read output of '", args.front(), "': ", std::strerror(errno));
            break;
        }

        output.append(buf, static_cast<std::size_t>(len));
    }

    close(fds[0]);

    int wstatus;
    while (waitpid(pid, &wstatus, 0) < 0)
    {
        if (errno == EINTR)
            continue;

        Error("failed to wait for '", args.front(), "': ", std::strerror(errno));
        return 1;
    }

    if (WIFEXITED(wstatus))
        status = WEXITSTATUS(wstatus);
    else if (WIFSIGNALED(wstatus))
        status = 128 + WTERMSIG(wstatus);
    else
        status = 1;

    return 0;
}

std::string JoinCommand(const std::vector<std::string> &args)
{
    std::string command;
    for (auto &arg : args)
    {
        if (!command.empty())
            command += ' ';
        command += arg;
    }
    return command;
}

#endif
