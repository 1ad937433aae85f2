// modsync - schema module workspace synchronizer
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace modsync {
    struct Config;
    struct Ecosystem;
    struct Log;

    struct StructureEntry {
        std::string ecosystem;
        std::string module;
        std::filesystem::path path;
        std::string reason;
    };

    struct StructureReport {
        std::vector<StructureEntry> ok;
        // StructureError: a module without its client directory or metadata file
        std::vector<StructureEntry> missing;
        // StructureWarning: a client directory without a module
        std::vector<StructureEntry> orphaned;

        bool passed() const noexcept { return missing.empty(); }
        bool clean() const noexcept { return missing.empty() && orphaned.empty(); }
    };

    // Read-only: classifies each client directory of every configured
    // ecosystem against the given modules.
    StructureReport validate(std::vector<std::string> const& modules, Config const& config, Log& log);
}
