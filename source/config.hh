// modsync - schema module workspace synchronizer
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace modsync {
    struct Log;

    enum class ManifestFormat {
        Toml,
        GoWork,
        Xml,
        Json,
    };
    std::ostream& operator<<(std::ostream& os, ManifestFormat format);
    bool parseManifestFormat(std::string_view text, ManifestFormat& out_format) noexcept;

    struct Ecosystem {
        std::string name;
        ManifestFormat format = ManifestFormat::Toml;
        // relative to the repository root
        std::filesystem::path manifest;
        // TOML table, JSON key, XML element or go.work directive holding the members
        std::string section;
        // member path with {module} substituted
        std::string memberTemplate = "{module}";
        std::vector<std::string> specialEntries;
        std::filesystem::path clientRoot;
        // required inside each client directory; empty to skip the check
        std::string metadataFile;
    };

    struct Config {
        std::filesystem::path root = ".";
        std::filesystem::path schemaDir = "proto";
        std::filesystem::path templateDir = "templates/service";

        std::vector<std::string> reservedNames;
        std::vector<std::string> infrastructureNames;
        std::vector<std::string> housekeepingNames;

        std::vector<Ecosystem> ecosystems;

        std::filesystem::path schemaRoot() const { return root / schemaDir; }
        std::filesystem::path templateRoot() const { return root / templateDir; }
        std::filesystem::path manifestPath(Ecosystem const& eco) const { return root / eco.manifest; }
        std::filesystem::path clientPath(Ecosystem const& eco) const { return root / eco.clientRoot; }

        Ecosystem const* findEcosystem(std::string_view name) const noexcept;
    };

    Config defaultConfig(std::filesystem::path root);

    // applies the overrides found in a JSON configuration file
    bool loadConfig(std::filesystem::path const& filename, Config& config, Log& log);

    // keeps only the named ecosystems, in configuration order
    bool selectEcosystems(Config& config, std::vector<std::string> const& names, Log& log);
}
