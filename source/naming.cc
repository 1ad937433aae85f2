// modsync - schema module workspace synchronizer
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "naming.hh"

namespace modsync {
    static auto isLower(char ch) -> bool { return ch >= 'a' && ch <= 'z'; }
    static auto isUpper(char ch) -> bool { return ch >= 'A' && ch <= 'Z'; }
    static auto isDigit(char ch) -> bool { return ch >= '0' && ch <= '9'; }
    static auto toLower(char ch) -> char { return isUpper(ch) ? static_cast<char>(ch - 'A' + 'a') : ch; }
    static auto toUpper(char ch) -> char { return isLower(ch) ? static_cast<char>(ch - 'a' + 'A') : ch; }

    bool isValidModuleName(std::string_view name) noexcept {
        if (name.empty() || !isLower(name.front()))
            return false;
        for (char const ch : name) {
            if (!isLower(ch) && !isDigit(ch) && ch != '-')
                return false;
        }
        return true;
    }

    bool isValidVersion(std::string_view version) noexcept {
        if (version.size() < 2 || version.front() != 'v')
            return false;
        for (char const ch : version.substr(1)) {
            if (!isDigit(ch))
                return false;
        }
        return true;
    }

    bool isValidEntityName(std::string_view name) noexcept {
        if (name.empty() || !(isLower(name.front()) || isUpper(name.front())))
            return false;
        for (char const ch : name) {
            if (!isLower(ch) && !isUpper(ch) && !isDigit(ch))
                return false;
        }
        return true;
    }

    std::string toTitleCase(std::string_view name) {
        std::string result;
        result.reserve(name.size());

        bool capitalize = true;
        for (char const ch : name) {
            if (ch == '-') {
                capitalize = true;
                continue;
            }
            result.push_back(capitalize ? toUpper(ch) : ch);
            capitalize = false;
        }
        return result;
    }

    std::string toUpperCase(std::string_view name) {
        std::string result;
        result.reserve(name.size());
        for (char const ch : name)
            result.push_back(ch == '-' ? '_' : toUpper(ch));
        return result;
    }

    std::string toSnakeCase(std::string_view name) {
        std::string result;
        result.reserve(name.size());
        for (char const ch : name)
            result.push_back(ch == '-' ? '_' : ch);
        return result;
    }

    std::string toKebabCase(std::string_view name) {
        std::string result;
        for (auto const& word : splitWords(name)) {
            if (!result.empty())
                result.push_back('-');
            result += word;
        }
        return result;
    }

    std::string toLowerCase(std::string_view text) {
        std::string result;
        result.reserve(text.size());
        for (char const ch : text)
            result.push_back(toLower(ch));
        return result;
    }

    std::vector<std::string> splitWords(std::string_view name) {
        std::vector<std::string> words;
        std::string current;

        auto const flush = [&] {
            if (!current.empty())
                words.push_back(std::move(current));
            current.clear();
        };

        for (size_t index = 0; index != name.size(); ++index) {
            char const ch = name[index];
            if (ch == '-' || ch == '_' || ch == ' ' || ch == '\t') {
                flush();
                continue;
            }

            // a hump starts a word: aB, or the last capital of an acronym in ABCdef
            if (isUpper(ch) && !current.empty()) {
                char const prev = name[index - 1];
                bool const nextLower = index + 1 < name.size() && isLower(name[index + 1]);
                if (isLower(prev) || isDigit(prev) || (isUpper(prev) && nextLower))
                    flush();
            }

            current.push_back(toLower(ch));
        }
        flush();

        return words;
    }
}
