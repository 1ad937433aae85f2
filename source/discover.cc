// modsync - schema module workspace synchronizer
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "discover.hh"
#include "log.hh"
#include "string_util.hh"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

modsync::ModuleSet modsync::discover(fs::path const& schemaRoot, std::vector<std::string> const& skip, Log& log) {
    ModuleSet modules;

    std::error_code ec;
    if (!fs::is_directory(schemaRoot, ec))
        return modules;

    fs::directory_iterator it(schemaRoot, ec);
    for (fs::directory_iterator const end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_directory(entry_ec))
            continue;

        auto name = it->path().filename().string();
        if (starts_with(name, ".") || contains(skip, name))
            continue;

        modules.push_back(std::move(name));
    }

    if (ec)
        log.error(Location{ schemaRoot }, "failed to scan modules: ", ec.message());

    std::sort(modules.begin(), modules.end());
    modules.erase(std::unique(modules.begin(), modules.end()), modules.end());
    return modules;
}
