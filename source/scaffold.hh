// modsync - schema module workspace synchronizer
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include "sync.hh"

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace modsync {
    struct Config;
    struct Log;

    struct ScaffoldRequest {
        std::string name;
        std::string description;
        std::string version;
        std::string entity;
    };

    enum class ScaffoldResult {
        Created,
        // ValidationError: bad request, nothing was touched
        InvalidInput,
        // the template set is missing or malformed, nothing was touched
        TemplateError,
        WriteError,
    };

    struct ScaffoldOutcome {
        ScaffoldResult result = ScaffoldResult::InvalidInput;
        std::filesystem::path modulePath;
        std::vector<std::filesystem::path> files;
        std::vector<EcosystemSync> synced;
    };

    using Placeholders = std::unordered_map<std::string, std::string>;

    // Checks the request in order and fills in the defaults for version,
    // entity and description. Reports only the first problem.
    bool validateRequest(ScaffoldRequest& request, Config const& config, Log& log);

    Placeholders placeholderValues(ScaffoldRequest const& request);

    // substitutes every {{NAME}}; unknown or unterminated placeholders fail
    bool renderTemplate(std::string_view source, Placeholders const& values, std::filesystem::path const& filename, std::string& out_text, Log& log);

    // Creates <schemaRoot>/<name>/ from the template set and then
    // synchronizes every ecosystem's manifest.
    ScaffoldOutcome scaffold(ScaffoldRequest request, Config const& config, Log& log);
}
