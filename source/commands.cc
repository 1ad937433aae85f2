// modsync - schema module workspace synchronizer
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "commands.hh"
#include "config.hh"
#include "discover.hh"
#include "log.hh"
#include "naming.hh"
#include "scaffold.hh"
#include "sync.hh"
#include "validate.hh"

#include <ostream>
#include <system_error>

namespace fs = std::filesystem;

namespace modsync {
    namespace {
        // sync and validate have nothing to do without modules
        bool requireModules(ModuleSet const& modules, Config const& config, Log& log) {
            if (!modules.empty())
                return true;
            return log.error(Location{ config.schemaRoot() }, "no schema modules found");
        }

        int printSyncResults(std::vector<EcosystemSync> const& results, bool check, std::ostream& out) {
            int status = exitSuccess;
            for (auto const& entry : results) {
                out << entry.ecosystem << ": " << entry.result << '\n';

                if (entry.result == SyncResult::WriteError)
                    status = exitWrite;
                else if (entry.result == SyncResult::ParseError && status != exitWrite)
                    status = exitFailed;
                else if (check && entry.result == SyncResult::Changed && status == exitSuccess)
                    status = exitDrift;
            }
            return status;
        }
    }

    bool loadConfiguration(fs::path const& root, fs::path const& configFile, std::vector<std::string> const& ecosystems, Config& out_config, Log& log) {
        out_config = defaultConfig(root);

        if (!configFile.empty()) {
            if (!loadConfig(configFile, out_config, log))
                return false;
        }
        else {
            auto const implicit = root / "modsync.json";
            std::error_code ec;
            if (fs::is_regular_file(implicit, ec) && !loadConfig(implicit, out_config, log))
                return false;
        }

        return selectEcosystems(out_config, ecosystems, log);
    }

    int runDiscover(Config const& config, std::ostream& out, Log& log) {
        auto const modules = discover(config.schemaRoot(), config.infrastructureNames, log);

        for (auto const& module : modules) {
            if (!isValidModuleName(module))
                log.warn(Location{ config.schemaRoot() / module }, "module name `", module, "' is not a valid module identifier");
            out << module << '\n';
        }

        return log.failed() ? exitFailed : exitSuccess;
    }

    int runSync(Config const& config, bool check, std::ostream& out, Log& log) {
        auto const modules = discover(config.schemaRoot(), config.infrastructureNames, log);
        if (!requireModules(modules, config, log))
            return exitFailed;

        return printSyncResults(syncAll(config, modules, log, check), check, out);
    }

    int runValidate(Config const& config, std::ostream& out, Log& log) {
        auto const modules = discover(config.schemaRoot(), config.infrastructureNames, log);
        if (!requireModules(modules, config, log))
            return exitFailed;

        auto const report = validate(modules, config, log);

        for (auto const& entry : report.ok)
            out << entry.ecosystem << ' ' << entry.module << ": ok\n";
        for (auto const& entry : report.missing)
            out << entry.ecosystem << ' ' << entry.module << ": missing (" << entry.reason << ")\n";
        for (auto const& entry : report.orphaned)
            out << entry.ecosystem << ' ' << entry.module << ": orphaned (" << entry.reason << ")\n";

        if (!report.passed() || log.failed())
            return exitFailed;
        return exitSuccess;
    }

    int runScaffold(Config const& config, ScaffoldRequest request, std::ostream& out, Log& log) {
        auto const outcome = scaffold(std::move(request), config, log);

        switch (outcome.result) {
        case ScaffoldResult::Created: break;
        case ScaffoldResult::InvalidInput: return exitFailed;
        case ScaffoldResult::TemplateError: return exitUsage;
        case ScaffoldResult::WriteError: return exitWrite;
        default: return exitFailed;
        }

        out << "created " << outcome.modulePath.string() << '\n';
        for (auto const& file : outcome.files)
            out << "  " << file.string() << '\n';

        return printSyncResults(outcome.synced, false, out);
    }
}
