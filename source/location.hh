// modsync - schema module workspace synchronizer
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include <filesystem>
#include <iosfwd>
#include <string_view>

namespace modsync {
    struct Position {
        int line = 0;
        int column = 0;

        bool operator==(Position const& rhs) const { return line == rhs.line && column == rhs.column; }
        bool operator!=(Position const& rhs) const { return line != rhs.line || column != rhs.column; }
    };

    struct Location {
        std::filesystem::path filename;
        Position start;

        bool operator==(Location const& rhs) const { return filename == rhs.filename && start == rhs.start; }
        friend std::ostream& operator<<(std::ostream& os, Location const& loc);
    };

    // 1-based line and column of a byte offset within text
    Position positionAt(std::string_view text, size_t offset) noexcept;
}
