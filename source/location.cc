// modsync - schema module workspace synchronizer
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "location.hh"
#include <iostream>

namespace modsync {
    std::ostream& operator<<(std::ostream& os, Location const& loc) {
        os << loc.filename.string();
        if (loc.start.line > 0 && loc.start.column > 0)
            os << '(' << loc.start.line << ',' << loc.start.column << ')';
        else if (loc.start.line > 0)
            os << '(' << loc.start.line << ')';
        return os;
    }

    Position positionAt(std::string_view text, size_t offset) noexcept {
        Position pos{ 1, 1 };
        if (offset > text.size())
            offset = text.size();

        for (size_t index = 0; index != offset; ++index) {
            if (text[index] == '\n') {
                ++pos.line;
                pos.column = 1;
            }
            else
                ++pos.column;
        }
        return pos;
    }
}
