// modsync - schema module workspace synchronizer
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace modsync {
    constexpr bool starts_with(std::string_view str, std::string_view prefix) noexcept {
        return str.size() >= prefix.size() && str.substr(0, prefix.size()) == prefix;
    }

    constexpr bool ends_with(std::string_view str, std::string_view suffix) noexcept {
        return str.size() >= suffix.size() && str.substr(str.size() - suffix.size()) == suffix;
    }

    constexpr std::string_view trim(std::string_view str) noexcept {
        auto const start = str.find_first_not_of(" \t\r\n");
        if (start == std::string_view::npos)
            return {};
        auto const end = str.find_last_not_of(" \t\r\n");
        return str.substr(start, (end + 1) - start);
    }

    inline bool contains(std::vector<std::string> const& list, std::string_view value) {
        return std::find(list.begin(), list.end(), value) != list.end();
    }

    inline void replaceAll(std::string& text, std::string_view from, std::string_view to) {
        if (from.empty())
            return;
        for (auto pos = text.find(from); pos != std::string::npos; pos = text.find(from, pos + to.size()))
            text.replace(pos, from.size(), to);
    }
}
