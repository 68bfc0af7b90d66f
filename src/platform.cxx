#include <log.hxx>
#include <platform.hxx>

#include <cerrno>
#include <cstring>
#include <map>

#include <sys/utsname.h>

static const std::map<std::string_view, std::string_view> os_map
{
    { "Linux", "linux" },
    { "Darwin", "darwin" },
};

static const std::map<std::string_view, std::string_view> cpu_map
{
    { "x86_64", "x86_64" },
    { "amd64", "x86_64" },
    { "aarch64", "arm64" },
    { "arm64", "arm64" },
    { "armv7l", "armv7" },
    { "i386", "x86" },
    { "i686", "x86" },
};

int ResolveArchitecture(const std::string_view os, const std::string_view cpu, std::string &arch)
{
    const auto os_it = os_map.find(os);
    if (os_it == os_map.end())
    {
        Error("unsupported OS type: ", os);
        return 1;
    }

    const auto cpu_it = cpu_map.find(cpu);
    if (cpu_it == cpu_map.end())
    {
        Error("unknown CPU type: ", cpu);
        return 1;
    }

    arch.clear();
    arch.append(cpu_it->second).append("-").append(os_it->second);
    return 0;
}

int GetHostArchitecture(std::string &arch)
{
    utsname name{};
    if (uname(&name))
    {
        Error("failed to query system information: ", std::strerror(errno));
        return 1;
    }

    if (const auto error = ResolveArchitecture(name.sysname, name.machine, arch))
    {
        return error;
    }

    return Assert(!arch.empty(), "assert_nz arch");
}
