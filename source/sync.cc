// modsync - schema module workspace synchronizer
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "sync.hh"
#include "config.hh"
#include "file_util.hh"
#include "log.hh"
#include "manifest.hh"
#include "string_util.hh"

#include <iostream>
#include <unordered_set>

namespace fs = std::filesystem;

namespace modsync {
    std::ostream& operator<<(std::ostream& os, SyncResult result) {
        switch (result) {
        case SyncResult::Unchanged: os << "unchanged"; break;
        case SyncResult::Changed: os << "changed"; break;
        case SyncResult::ParseError:
        case SyncResult::WriteError: os << "error"; break;
        default: os << "[unknown-result]"; break;
        }
        return os;
    }

    std::string expandMemberPath(std::string_view pattern, std::string_view module) {
        std::string path{ pattern };
        replaceAll(path, "{module}", module);
        return path;
    }

    std::vector<std::string> desiredMembers(Ecosystem const& eco, std::vector<std::string> const& modules) {
        std::vector<std::string> members;
        std::unordered_set<std::string> seen;

        auto const add = [&](std::string entry) {
            if (seen.insert(entry).second)
                members.push_back(std::move(entry));
        };

        for (auto const& entry : eco.specialEntries)
            add(entry);
        for (auto const& module : modules)
            add(expandMemberPath(eco.memberTemplate, module));

        return members;
    }

    SyncResult sync(Ecosystem const& eco, fs::path const& manifestPath, std::vector<std::string> const& modules, Log& log, bool check) {
        Location const loc{ manifestPath };

        auto adapter = createManifestAdapter(eco);
        if (adapter == nullptr) {
            log.error(loc, "[", eco.name, "] unsupported manifest format `", eco.format, "'");
            return SyncResult::ParseError;
        }

        std::string text;
        if (!loadText(manifestPath, text)) {
            log.error(loc, "[", eco.name, "] failed to read workspace manifest");
            return SyncResult::ParseError;
        }

        if (!adapter->parse(std::move(text), manifestPath, log)) {
            log.info(loc, "[", eco.name, "] workspace manifest left untouched");
            return SyncResult::ParseError;
        }

        auto const desired = desiredMembers(eco, modules);
        if (adapter->members() == desired)
            return SyncResult::Unchanged;

        if (check)
            return SyncResult::Changed;

        adapter->replaceMembers(desired);

        std::string error;
        if (!writeTextStaged(manifestPath, adapter->serialize(), error)) {
            log.error(loc, "[", eco.name, "] ", error);
            return SyncResult::WriteError;
        }

        return SyncResult::Changed;
    }

    std::vector<EcosystemSync> syncAll(Config const& config, std::vector<std::string> const& modules, Log& log, bool check) {
        std::vector<EcosystemSync> results;
        results.reserve(config.ecosystems.size());

        for (auto const& eco : config.ecosystems) {
            auto const path = config.manifestPath(eco);
            results.push_back({ eco.name, path, sync(eco, path, modules, log, check) });
        }

        return results;
    }
}
