// modsync - schema module workspace synchronizer
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "validate.hh"
#include "config.hh"
#include "log.hh"
#include "string_util.hh"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace modsync {
    namespace {
        struct Validator {
            std::vector<std::string> const& modules;
            Config const& config;
            Log& log;
            StructureReport report;

            inline void checkModules(Ecosystem const& eco);
            inline void checkOrphans(Ecosystem const& eco);
        };
    }
}

modsync::StructureReport modsync::validate(std::vector<std::string> const& modules, Config const& config, Log& log) {
    Validator validator{ modules, config, log, {} };
    for (auto const& eco : config.ecosystems) {
        validator.checkModules(eco);
        validator.checkOrphans(eco);
    }
    return std::move(validator.report);
}

void modsync::Validator::checkModules(Ecosystem const& eco) {
    auto const clientRoot = config.clientPath(eco);

    for (auto const& module : modules) {
        auto const dir = clientRoot / module;

        std::error_code ec;
        if (!fs::is_directory(dir, ec)) {
            log.error(Location{ dir }, "[", eco.name, "] client directory for module `", module, "' is missing");
            report.missing.push_back({ eco.name, module, dir, "directory missing" });
            continue;
        }

        if (!eco.metadataFile.empty()) {
            auto const metadata = dir / eco.metadataFile;
            if (!fs::is_regular_file(metadata, ec)) {
                log.error(Location{ metadata }, "[", eco.name, "] module `", module, "' has no ", eco.metadataFile);
                report.missing.push_back({ eco.name, module, metadata, eco.metadataFile + " missing" });
                continue;
            }
        }

        report.ok.push_back({ eco.name, module, dir, {} });
    }
}

void modsync::Validator::checkOrphans(Ecosystem const& eco) {
    auto const clientRoot = config.clientPath(eco);

    std::error_code ec;
    if (!fs::is_directory(clientRoot, ec))
        return;

    std::vector<fs::path> orphans;
    fs::directory_iterator it(clientRoot, ec);
    for (fs::directory_iterator const end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_directory(entry_ec))
            continue;

        auto const name = it->path().filename().string();
        if (starts_with(name, ".") || contains(config.housekeepingNames, name) || contains(modules, name))
            continue;

        orphans.push_back(it->path());
    }

    if (ec)
        log.error(Location{ clientRoot }, "[", eco.name, "] failed to scan client directory: ", ec.message());

    // directory order is unspecified
    std::sort(orphans.begin(), orphans.end());
    for (auto const& path : orphans) {
        auto name = path.filename().string();
        log.warn(Location{ path }, "[", eco.name, "] `", name, "' has no schema module");
        report.orphaned.push_back({ eco.name, std::move(name), path, "no schema module" });
    }
}
