#if defined(SYSTEM_LINUX) || defined(SYSTEM_DARWIN)

#include <log.hxx>
#include <tempdir.hxx>

#include <atomic>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <vector>

#include <dirent.h>
#include <fcntl.h>
#include <unistd.h>

constexpr auto MAX_TRACKED = 16;
constexpr auto MAX_DEPTH = 8;

constexpr int cleanup_signals[] = { SIGINT, SIGTERM, SIGHUP, SIGQUIT };

// filled in before any signal can refer to them; the handler reads nothing else
static struct
{
    volatile std::sig_atomic_t Used;
    char Path[PATH_MAX];
} tracked_slots[MAX_TRACKED];

// depth-bounded and free of std::filesystem, so the signal handler can use it
static void remove_tree(const int dirfd, const char *name, const int depth)
{
    if (!unlinkat(dirfd, name, 0) || errno == ENOENT)
        return;

    if (depth > 0)
    {
        if (const auto fd = openat(dirfd, name, O_RDONLY | O_DIRECTORY | O_NOFOLLOW); fd >= 0)
        {
            if (const auto dir = fdopendir(fd))
            {
                while (const auto entry = readdir(dir))
                {
                    if (!std::strcmp(entry->d_name, ".") || !std::strcmp(entry->d_name, ".."))
                        continue;
                    remove_tree(fd, entry->d_name, depth - 1);
                }
                closedir(dir);
            }
            else
            {
                close(fd);
            }
        }
    }

    unlinkat(dirfd, name, AT_REMOVEDIR);
}

static void handle_signal(const int sig)
{
    for (auto &slot : tracked_slots)
    {
        if (slot.Used)
            remove_tree(AT_FDCWD, slot.Path, MAX_DEPTH);
    }

    // the signal is blocked while we run and fires with the default action on return
    std::signal(sig, SIG_DFL);
    std::raise(sig);
}

static void install_handlers()
{
    static bool installed = false;
    if (installed)
        return;
    installed = true;

    std::atexit(CleanupTracked);

    struct sigaction action{};
    action.sa_handler = handle_signal;
    sigemptyset(&action.sa_mask);
    for (const auto sig : cleanup_signals)
        sigaddset(&action.sa_mask, sig);

    for (const auto sig : cleanup_signals)
        sigaction(sig, &action, nullptr);
}

int TrackCleanup(const std::filesystem::path &path)
{
    const auto &string = path.native();
    if (string.size() >= PATH_MAX)
    {
        Error("path too long to track for cleanup: ", string);
        return 1;
    }

    install_handlers();

    for (auto &slot : tracked_slots)
    {
        if (slot.Used)
            continue;

        std::memcpy(slot.Path, string.c_str(), string.size() + 1);
        std::atomic_signal_fence(std::memory_order_seq_cst);
        slot.Used = 1;
        return 0;
    }

    Error("too many temporary directories tracked for cleanup");
    return 1;
}

void UntrackCleanup(const std::filesystem::path &path)
{
    for (auto &slot : tracked_slots)
    {
        if (slot.Used && path.native() == slot.Path)
            slot.Used = 0;
    }
}

void CleanupTracked()
{
    for (auto &slot : tracked_slots)
    {
        if (!slot.Used)
            continue;

        std::error_code error;
        std::filesystem::remove_all(slot.Path, error);
        slot.Used = 0;
    }
}

TempDirectory::~TempDirectory()
{
    Remove();
}

int TempDirectory::Create(const std::filesystem::path &parent, const std::string_view prefix)
{
    Remove();

    auto pattern = (parent / prefix).string() + "XXXXXX";

    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (!mkdtemp(buffer.data()))
    {
        Error("failed to create temporary directory in ", parent.string(), ": ", std::strerror(errno));
        return 1;
    }

    m_Path = buffer.data();
    if (const auto error = TrackCleanup(m_Path))
    {
        std::error_code remove_error;
        std::filesystem::remove_all(m_Path, remove_error);
        m_Path.clear();
        return error;
    }

    return 0;
}

void TempDirectory::Remove()
{
    if (m_Path.empty())
        return;

    std::error_code error;
    std::filesystem::remove_all(m_Path, error);
    if (error)
        Warn("failed to remove temporary directory ", m_Path.string(), ": ", error.message());

    UntrackCleanup(m_Path);
    m_Path.clear();
}

#endif
