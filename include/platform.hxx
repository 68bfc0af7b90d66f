#pragma once

#include <string>
#include <string_view>

/**
 * Maps a kernel name (`uname -s`) and a machine type (`uname -m`) to the
 * canonical `{cpu}-{os}` tag, e.g. `x86_64-linux` or `arm64-darwin`.
 */
int ResolveArchitecture(std::string_view os, std::string_view cpu, std::string &arch);

int GetHostArchitecture(std::string &arch);
