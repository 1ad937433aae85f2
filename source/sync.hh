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
    struct Config;
    struct Ecosystem;
    struct Log;

    enum class SyncResult {
        Unchanged,
        Changed,
        ParseError,
        WriteError,
    };
    std::ostream& operator<<(std::ostream& os, SyncResult result);

    constexpr bool isError(SyncResult result) noexcept { return result == SyncResult::ParseError || result == SyncResult::WriteError; }

    struct EcosystemSync {
        std::string ecosystem;
        std::filesystem::path manifest;
        SyncResult result = SyncResult::Unchanged;
    };

    // "packages/{module}" + "idp" -> "packages/idp"
    std::string expandMemberPath(std::string_view pattern, std::string_view module);

    // special entries first, then one path per module; duplicates dropped
    std::vector<std::string> desiredMembers(Ecosystem const& eco, std::vector<std::string> const& modules);

    // Rewrites the members section of one manifest. With check set, nothing
    // is written and Changed reports drift.
    SyncResult sync(Ecosystem const& eco, std::filesystem::path const& manifestPath, std::vector<std::string> const& modules, Log& log, bool check = false);

    // every configured ecosystem; a failure in one never stops the others
    std::vector<EcosystemSync> syncAll(Config const& config, std::vector<std::string> const& modules, Log& log, bool check = false);
}
