// modsync - schema module workspace synchronizer
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "config.hh"
#include "file_util.hh"
#include "log.hh"
#include "string_util.hh"

#include <algorithm>
#include <iostream>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace modsync {
    std::ostream& operator<<(std::ostream& os, ManifestFormat format) {
        switch (format) {
        case ManifestFormat::Toml: os << "toml"; break;
        case ManifestFormat::GoWork: os << "go.work"; break;
        case ManifestFormat::Xml: os << "xml"; break;
        case ManifestFormat::Json: os << "json"; break;
        default: os << "[unknown-format]"; break;
        }
        return os;
    }

    bool parseManifestFormat(std::string_view text, ManifestFormat& out_format) noexcept {
        if (text == "toml")
            out_format = ManifestFormat::Toml;
        else if (text == "go.work" || text == "gowork")
            out_format = ManifestFormat::GoWork;
        else if (text == "xml")
            out_format = ManifestFormat::Xml;
        else if (text == "json")
            out_format = ManifestFormat::Json;
        else
            return false;
        return true;
    }

    Ecosystem const* Config::findEcosystem(std::string_view name) const noexcept {
        for (auto const& eco : ecosystems) {
            if (eco.name == name)
                return &eco;
        }
        return nullptr;
    }

    Config defaultConfig(fs::path root) {
        Config config;
        config.root = std::move(root);

        config.reservedNames = { "core", "common", "google", "grpc", "validate" };
        config.infrastructureNames = { "proto" };
        config.housekeepingNames = { "proto", "target", "node_modules", ".venv", "packages", "com", "google", "validate" };

        {
            Ecosystem rust;
            rust.name = "rust";
            rust.format = ManifestFormat::Toml;
            rust.manifest = "clients/rust/Cargo.toml";
            rust.section = "workspace";
            rust.clientRoot = "clients/rust";
            rust.metadataFile = "Cargo.toml";
            config.ecosystems.push_back(std::move(rust));
        }
        {
            Ecosystem go;
            go.name = "go";
            go.format = ManifestFormat::GoWork;
            go.manifest = "clients/go/go.work";
            go.section = "use";
            go.memberTemplate = "./{module}";
            go.clientRoot = "clients/go";
            go.metadataFile = "go.mod";
            config.ecosystems.push_back(std::move(go));
        }
        {
            Ecosystem python;
            python.name = "python";
            python.format = ManifestFormat::Toml;
            python.manifest = "clients/python/pyproject.toml";
            python.section = "tool.uv.workspace";
            python.clientRoot = "clients/python";
            python.metadataFile = "pyproject.toml";
            config.ecosystems.push_back(std::move(python));
        }
        {
            Ecosystem typescript;
            typescript.name = "typescript";
            typescript.format = ManifestFormat::Json;
            typescript.manifest = "clients/typescript/package.json";
            typescript.section = "workspaces";
            typescript.memberTemplate = "packages/{module}";
            typescript.specialEntries = { "packages/validate", "packages/google" };
            typescript.clientRoot = "clients/typescript/packages";
            typescript.metadataFile = "package.json";
            config.ecosystems.push_back(std::move(typescript));
        }
        {
            Ecosystem java;
            java.name = "java";
            java.format = ManifestFormat::Xml;
            java.manifest = "clients/java/pom.xml";
            java.section = "modules";
            java.clientRoot = "clients/java";
            java.metadataFile = "pom.xml";
            config.ecosystems.push_back(std::move(java));
        }

        return config;
    }

    namespace {
        using JsonT = nlohmann::ordered_json;

        void readStrings(JsonT const& doc, char const* key, std::vector<std::string>& out) {
            auto const it = doc.find(key);
            if (it == doc.end())
                return;
            out = it->get<std::vector<std::string>>();
        }

        void readString(JsonT const& doc, char const* key, std::string& out) {
            auto const it = doc.find(key);
            if (it != doc.end())
                out = it->get<std::string>();
        }

        void readPath(JsonT const& doc, char const* key, fs::path& out) {
            auto const it = doc.find(key);
            if (it != doc.end())
                out = it->get<std::string>();
        }

        bool readEcosystem(JsonT const& eco_json, Ecosystem& eco, Location const& loc, Log& log) {
            if (!eco_json.is_object())
                return log.error(loc, "ecosystem `", eco.name, "' must be an object");

            auto const formatIt = eco_json.find("format");
            if (formatIt != eco_json.end()) {
                auto const text = formatIt->get<std::string>();
                if (!parseManifestFormat(text, eco.format))
                    return log.error(loc, "ecosystem `", eco.name, "' has unknown format `", text, "'");
            }

            readPath(eco_json, "manifest", eco.manifest);
            readString(eco_json, "section", eco.section);
            readString(eco_json, "member", eco.memberTemplate);
            readStrings(eco_json, "special", eco.specialEntries);
            readPath(eco_json, "clientRoot", eco.clientRoot);
            readString(eco_json, "metadata", eco.metadataFile);

            if (eco.manifest.empty() || eco.section.empty() || eco.clientRoot.empty())
                return log.error(loc, "ecosystem `", eco.name, "' requires `manifest', `section' and `clientRoot'");
            if (eco.memberTemplate.find("{module}") == std::string::npos)
                return log.error(loc, "ecosystem `", eco.name, "' member template `", eco.memberTemplate, "' does not reference {module}");

            return true;
        }
    }

    bool loadConfig(fs::path const& filename, Config& config, Log& log) {
        Location const loc{ filename };

        std::string text;
        if (!loadText(filename, text))
            return log.error(loc, "failed to open configuration file");

        try {
            auto const doc = JsonT::parse(text);
            if (!doc.is_object())
                return log.error(loc, "configuration must be a JSON object");

            readPath(doc, "schemaRoot", config.schemaDir);
            readPath(doc, "templates", config.templateDir);
            readStrings(doc, "reservedNames", config.reservedNames);
            readStrings(doc, "infrastructureNames", config.infrastructureNames);
            readStrings(doc, "housekeepingNames", config.housekeepingNames);

            auto const ecosIt = doc.find("ecosystems");
            if (ecosIt == doc.end())
                return true;
            if (!ecosIt->is_object())
                return log.error(loc, "`ecosystems' must be an object keyed by ecosystem name");

            bool ok = true;
            for (auto const& item : ecosIt->items()) {
                auto const& name = item.key();
                auto const& eco_json = item.value();
                auto const existing = std::find_if(config.ecosystems.begin(), config.ecosystems.end(),
                    [&name](Ecosystem const& eco) { return eco.name == name; });

                auto const enabledIt = eco_json.is_object() ? eco_json.find("enabled") : eco_json.end();
                if (enabledIt != eco_json.end() && !enabledIt->get<bool>()) {
                    if (existing != config.ecosystems.end())
                        config.ecosystems.erase(existing);
                    continue;
                }

                Ecosystem eco;
                if (existing != config.ecosystems.end())
                    eco = *existing;
                else
                    eco.name = name;

                if (!readEcosystem(eco_json, eco, loc, log)) {
                    ok = false;
                    continue;
                }

                if (existing != config.ecosystems.end())
                    *existing = std::move(eco);
                else
                    config.ecosystems.push_back(std::move(eco));
            }
            return ok;
        }
        catch (nlohmann::json::parse_error const& e) {
            Location const at{ filename, positionAt(text, e.byte > 0 ? e.byte - 1 : 0) };
            return log.error(at, "malformed configuration: ", e.what());
        }
        catch (nlohmann::json::exception const& e) {
            return log.error(loc, "invalid configuration: ", e.what());
        }
    }

    bool selectEcosystems(Config& config, std::vector<std::string> const& names, Log& log) {
        if (names.empty())
            return true;

        bool ok = true;
        for (auto const& name : names) {
            if (config.findEcosystem(name) == nullptr)
                ok = log.error(Location{ config.root }, "unknown ecosystem `", name, "'");
        }
        if (!ok)
            return false;

        auto const unselected = [&names](Ecosystem const& eco) { return !contains(names, eco.name); };
        config.ecosystems.erase(std::remove_if(config.ecosystems.begin(), config.ecosystems.end(), unselected), config.ecosystems.end());
        return true;
    }
}
