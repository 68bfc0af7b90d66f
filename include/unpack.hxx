#pragma once

#include <filesystem>
#include <string_view>

/**
 * Release assets are either the bare binary or an archive holding it.
 *
 * If `artifact` is a recognized archive (optionally compressed), the first
 * regular file named `name` is extracted into `directory` and `result`
 * points at it. A compressed single file (e.g. `rzup.gz`) is decompressed to
 * `directory / name`. Anything else is taken to be the binary itself and
 * `result` is set to `artifact`.
 */
int UnpackArtifact(const std::filesystem::path &artifact,
                   std::string_view name,
                   const std::filesystem::path &directory,
                   std::filesystem::path &result);
