// modsync - schema module workspace synchronizer
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace modsync {
    struct Config;
    struct Log;
    struct ScaffoldRequest;

    enum ExitCode : int {
        exitSuccess = 0,
        // bad arguments, configuration or template set
        exitUsage = 1,
        // invalid input, parse errors, missing client entries, no modules
        exitFailed = 2,
        exitWrite = 3,
        // sync --check found manifests out of date
        exitDrift = 4,
    };

    // Defaults, then --config or <root>/modsync.json, then the ecosystem filter.
    bool loadConfiguration(std::filesystem::path const& root, std::filesystem::path const& configFile, std::vector<std::string> const& ecosystems, Config& out_config, Log& log);

    // Each command prints its results to out and its diagnostics to log,
    // and returns the process exit code.
    int runDiscover(Config const& config, std::ostream& out, Log& log);
    int runSync(Config const& config, bool check, std::ostream& out, Log& log);
    int runValidate(Config const& config, std::ostream& out, Log& log);
    int runScaffold(Config const& config, ScaffoldRequest request, std::ostream& out, Log& log);
}
