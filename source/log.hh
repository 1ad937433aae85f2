// modsync - schema module workspace synchronizer
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include "location.hh"

#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace modsync {
    struct Log {
        std::vector<std::string> lines;
        int countErrors = 0;
        int countWarnings = 0;

        template <typename... T>
        bool error(Location const& loc, T const&... args) {
            std::ostringstream buffer;
            ((buffer << loc << ": error: ") << ... << args);
            lines.push_back(buffer.str());
            ++countErrors;
            return false; // convenience
        }

        template <typename... T>
        void warn(Location const& loc, T const&... args) {
            std::ostringstream buffer;
            ((buffer << loc << ": warning: ") << ... << args);
            lines.push_back(buffer.str());
            ++countWarnings;
        }

        template <typename... T>
        void info(Location const& loc, T const&... args) {
            std::ostringstream buffer;
            ((buffer << loc << ": info: ") << ... << args);
            lines.push_back(buffer.str());
        }

        bool failed() const noexcept { return countErrors != 0; }

        void flush(std::ostream& os) {
            for (auto const& line : lines)
                os << line << '\n';
            lines.clear();
        }
    };
}
