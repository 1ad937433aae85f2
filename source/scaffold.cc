// modsync - schema module workspace synchronizer
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "scaffold.hh"
#include "config.hh"
#include "discover.hh"
#include "file_util.hh"
#include "log.hh"
#include "naming.hh"
#include "string_util.hh"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace modsync {
    static constexpr std::string_view templateExtension = ".template";
    static constexpr std::string_view documentationTemplate = "README.md.template";

    namespace {
        struct RenderedFile {
            fs::path target;
            std::string contents;
        };

        bool renderTemplateSet(fs::path const& templateRoot, Placeholders const& values, fs::path const& moduleDir, fs::path const& versionDir, std::vector<RenderedFile>& out_files, Log& log) {
            Location const loc{ templateRoot };

            std::error_code ec;
            if (!fs::is_directory(templateRoot, ec))
                return log.error(loc, "template directory not found");

            std::vector<fs::path> sources;
            fs::directory_iterator it(templateRoot, ec);
            for (fs::directory_iterator const end; !ec && it != end; it.increment(ec)) {
                std::error_code entry_ec;
                if (it->is_regular_file(entry_ec) && ends_with(it->path().filename().string(), templateExtension))
                    sources.push_back(it->path());
            }
            if (ec)
                return log.error(loc, "failed to read template directory: ", ec.message());

            std::sort(sources.begin(), sources.end());

            bool ok = true;
            bool hasModuleFile = false;
            for (auto const& source : sources) {
                auto const filename = source.filename().string();

                std::string text;
                if (!loadText(source, text)) {
                    ok = log.error(Location{ source }, "failed to read template");
                    continue;
                }

                RenderedFile file;
                if (!renderTemplate(text, values, source, file.contents, log)) {
                    ok = false;
                    continue;
                }

                if (filename == documentationTemplate) {
                    file.target = moduleDir / "README.md";
                }
                else {
                    std::string name;
                    auto const stem = filename.substr(0, filename.size() - templateExtension.size());
                    if (!renderTemplate(stem, values, source, name, log)) {
                        ok = false;
                        continue;
                    }
                    if (name.empty() || name.find_first_of("/\\") != std::string::npos) {
                        ok = log.error(Location{ source }, "template renders to invalid file name `", name, "'");
                        continue;
                    }
                    file.target = versionDir / name;
                    hasModuleFile = true;
                }

                out_files.push_back(std::move(file));
            }

            if (ok && !hasModuleFile)
                return log.error(loc, "template set has no module file templates");

            return ok;
        }
    }

    bool validateRequest(ScaffoldRequest& request, Config const& config, Log& log) {
        Location const loc{ config.schemaRoot() };
        auto const& name = request.name;

        if (name.empty())
            return log.error(loc, "module name cannot be empty");

        if (!isValidModuleName(name))
            return log.error(loc, "module name `", name, "' must start with a lowercase letter and contain only lowercase letters, digits and hyphens");

        std::error_code ec;
        if (fs::exists(config.schemaRoot() / name, ec))
            return log.error(Location{ config.schemaRoot() / name }, "module `", name, "' already exists");

        if (contains(config.reservedNames, name) || contains(config.infrastructureNames, name))
            return log.error(loc, "module name `", name, "' is reserved");

        if (request.version.empty())
            request.version = "v1";
        if (!isValidVersion(request.version))
            return log.error(loc, "version `", request.version, "' must be in the form v1, v2, ...");

        if (request.entity.empty())
            request.entity = toTitleCase(name);
        if (!isValidEntityName(request.entity))
            return log.error(loc, "entity name `", request.entity, "' must be an identifier such as User or Notification");

        if (trim(request.description).empty())
            request.description = "Service for " + name;

        return true;
    }

    Placeholders placeholderValues(ScaffoldRequest const& request) {
        auto const entityWords = splitWords(request.entity);

        std::string entitySnake;
        for (auto const& word : entityWords) {
            if (!entitySnake.empty())
                entitySnake.push_back('_');
            entitySnake += word;
        }

        return {
            { "MODULE_NAME", request.name },
            { "MODULE_NAME_TITLE", toTitleCase(request.name) },
            { "MODULE_NAME_UPPER", toUpperCase(request.name) },
            { "MODULE_NAME_SNAKE", toSnakeCase(request.name) },
            { "MODULE_NAME_KEBAB", toKebabCase(request.name) },
            { "MODULE_DESCRIPTION", request.description },
            { "MODULE_DESCRIPTION_LOWER", toLowerCase(request.description) },
            { "VERSION", request.version },
            { "ENTITY_NAME", request.entity },
            { "ENTITY_NAME_LOWER", toLowerCase(request.entity) },
            { "ENTITY_NAME_SNAKE", entitySnake },
            { "ENTITY_NAME_UPPER", toUpperCase(entitySnake) },
            { "MESSAGE_PREFIX", toTitleCase(request.name) },
        };
    }

    bool renderTemplate(std::string_view source, Placeholders const& values, fs::path const& filename, std::string& out_text, Log& log) {
        out_text.clear();
        out_text.reserve(source.size());

        bool ok = true;
        size_t position = 0;
        for (;;) {
            auto const open = source.find("{{", position);
            if (open == std::string_view::npos) {
                out_text.append(source.substr(position));
                break;
            }
            out_text.append(source.substr(position, open - position));

            auto const close = source.find("}}", open + 2);
            if (close == std::string_view::npos) {
                ok = log.error(Location{ filename, positionAt(source, open) }, "unterminated placeholder");
                break;
            }

            auto const name = std::string{ trim(source.substr(open + 2, close - open - 2)) };
            auto const it = values.find(name);
            if (it == values.end())
                ok = log.error(Location{ filename, positionAt(source, open) }, "unknown placeholder {{", name, "}}");
            else
                out_text += it->second;

            position = close + 2;
        }

        return ok;
    }

    ScaffoldOutcome scaffold(ScaffoldRequest request, Config const& config, Log& log) {
        ScaffoldOutcome outcome;

        if (!validateRequest(request, config, log)) {
            outcome.result = ScaffoldResult::InvalidInput;
            return outcome;
        }

        auto const moduleDir = config.schemaRoot() / request.name;
        auto const versionDir = moduleDir / request.version;

        std::vector<RenderedFile> files;
        if (!renderTemplateSet(config.templateRoot(), placeholderValues(request), moduleDir, versionDir, files, log)) {
            outcome.result = ScaffoldResult::TemplateError;
            return outcome;
        }

        // undo a partially materialized module
        auto const rollback = [&](std::string const& message) {
            log.error(Location{ moduleDir }, message);
            std::error_code ignored;
            fs::remove_all(moduleDir, ignored);
            outcome.result = ScaffoldResult::WriteError;
            outcome.files.clear();
            return outcome;
        };

        std::error_code ec;
        fs::create_directories(versionDir, ec);
        if (ec)
            return rollback("failed to create module directory: " + ec.message());

        for (auto const& file : files) {
            std::string error;
            if (!writeTextStaged(file.target, file.contents, error))
                return rollback(error);
            outcome.files.push_back(file.target);
        }

        outcome.result = ScaffoldResult::Created;
        outcome.modulePath = moduleDir;

        // files are renamed into place above, so the new module is visible here
        auto const modules = discover(config.schemaRoot(), config.infrastructureNames, log);
        outcome.synced = syncAll(config, modules, log);

        return outcome;
    }
}
