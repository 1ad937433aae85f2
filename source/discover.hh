// modsync - schema module workspace synchronizer
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace modsync {
    struct Log;

    using ModuleSet = std::vector<std::string>;

    // Lists the module directories directly under schemaRoot, sorted. Hidden
    // entries and the names in `skip' are not modules. A missing schemaRoot
    // yields an empty set.
    ModuleSet discover(std::filesystem::path const& schemaRoot, std::vector<std::string> const& skip, Log& log);
}
