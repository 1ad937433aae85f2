// modsync - schema module workspace synchronizer
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "manifest.hh"
#include "log.hh"
#include "string_util.hh"

#include <cstdint>
#include <string_view>

namespace fs = std::filesystem;

namespace modsync {
    namespace {
        auto isBareKeyChar(char ch) -> bool {
            return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '_' || ch == '-';
        }
        auto isHexDigit(char ch) -> bool { return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f') || (ch >= 'A' && ch <= 'F'); }

        void appendUtf8(std::string& out, std::uint32_t cp) {
            if (cp < 0x80)
                out.push_back(static_cast<char>(cp));
            else if (cp < 0x800) {
                out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
            else if (cp < 0x10000) {
                out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
            else {
                out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        struct TomlScanner {
            std::string_view source;
            size_t position = 0;

            std::string message;
            size_t failAt = 0;

            bool atEnd() const noexcept { return position >= source.size(); }
            char peek(size_t ahead = 0) const noexcept { return position + ahead < source.size() ? source[position + ahead] : '\0'; }

            bool match(std::string_view input) {
                if (source.substr(position, input.size()) != input)
                    return false;
                position += input.size();
                return true;
            }

            bool fail(std::string text, size_t at) {
                message = std::move(text);
                failAt = at;
                return false;
            }

            void skipSpaces() {
                while (peek() == ' ' || peek() == '\t')
                    ++position;
            }

            void skipComment() {
                if (peek() != '#')
                    return;
                while (!atEnd() && peek() != '\n')
                    ++position;
            }

            // spaces, comments and line breaks
            void skipBlank() {
                for (;;) {
                    skipSpaces();
                    if (peek() == '#')
                        skipComment();
                    else if (peek() == '\n' || peek() == '\r')
                        ++position;
                    else
                        break;
                }
            }

            // as skipBlank, but keeps the comments; one still on the line of
            // `after' trails that entry
            void skipBlank(SectionComments& out_comments, std::string const* after) {
                bool sameLine = after != nullptr;
                for (;;) {
                    skipSpaces();
                    if (peek() == '#') {
                        auto const start = position;
                        skipComment();
                        std::string comment{ trim(source.substr(start, position - start)) };
                        if (sameLine)
                            out_comments.trailing[*after] = std::move(comment);
                        else
                            out_comments.lines.push_back(std::move(comment));
                    }
                    else if (peek() == '\n' || peek() == '\r') {
                        sameLine = false;
                        ++position;
                    }
                    else
                        break;
                }
            }

            inline bool scanKey(std::string& out);
            inline bool scanString(std::string& out);
            inline bool scanArray(std::vector<std::string>* out_strings, SectionComments* out_comments = nullptr);
            inline bool scanInlineTable();
            inline bool scanValue();
        };

        // dotted keys are normalized to `a.b.c'
        bool TomlScanner::scanKey(std::string& out) {
            out.clear();
            for (;;) {
                skipSpaces();
                auto const start = position;

                if (peek() == '"' || peek() == '\'') {
                    std::string segment;
                    if (!scanString(segment))
                        return false;
                    out += segment;
                }
                else {
                    while (isBareKeyChar(peek()))
                        ++position;
                    if (position == start)
                        return fail("expected key", start);
                    out.append(source.substr(start, position - start));
                }

                skipSpaces();
                if (peek() != '.')
                    return true;
                ++position;
                out.push_back('.');
            }
        }

        bool TomlScanner::scanString(std::string& out) {
            auto const start = position;

            if (match("'''")) {
                auto const end = source.find("'''", position);
                if (end == std::string_view::npos)
                    return fail("unterminated multi-line literal string", start);
                out.assign(source.substr(position, end - position));
                position = end + 3;
                return true;
            }

            if (match("'")) {
                auto const end = source.find_first_of("'\n", position);
                if (end == std::string_view::npos || source[end] != '\'')
                    return fail("unterminated literal string", start);
                out.assign(source.substr(position, end - position));
                position = end + 1;
                return true;
            }

            bool const multiline = match("\"\"\"");
            if (!multiline && !match("\""))
                return fail("expected string", start);

            out.clear();
            for (;;) {
                if (atEnd())
                    return fail("unterminated string", start);

                auto const ch = peek();
                if (multiline && match("\"\"\""))
                    return true;
                if (!multiline && ch == '"') {
                    ++position;
                    return true;
                }
                if (!multiline && ch == '\n')
                    return fail("unterminated string", start);

                ++position;
                if (ch != '\\') {
                    out.push_back(ch);
                    continue;
                }

                auto const esc = peek();
                ++position;
                switch (esc) {
                case 'b': out.push_back('\b'); break;
                case 't': out.push_back('\t'); break;
                case 'n': out.push_back('\n'); break;
                case 'f': out.push_back('\f'); break;
                case 'r': out.push_back('\r'); break;
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case 'u':
                case 'U': {
                    size_t const digits = esc == 'u' ? 4 : 8;
                    std::uint32_t cp = 0;
                    for (size_t index = 0; index != digits; ++index) {
                        auto const hex = peek();
                        if (!isHexDigit(hex))
                            return fail("invalid unicode escape", position);
                        cp = cp * 16 + static_cast<std::uint32_t>(hex <= '9' ? hex - '0' : (hex | 0x20) - 'a' + 10);
                        ++position;
                    }
                    appendUtf8(out, cp);
                    break;
                }
                case '\n':
                case '\r':
                case ' ':
                case '\t':
                    // line ending backslash trims the following whitespace
                    if (!multiline)
                        return fail("invalid escape sequence", position - 1);
                    while (peek() == ' ' || peek() == '\t' || peek() == '\n' || peek() == '\r')
                        ++position;
                    break;
                default:
                    return fail("invalid escape sequence", position - 1);
                }
            }
        }

        bool TomlScanner::scanArray(std::vector<std::string>* out_strings, SectionComments* out_comments) {
            auto const start = position;
            if (!match("["))
                return fail("expected `['", start);

            auto const blank = [&] {
                if (out_comments == nullptr || out_strings == nullptr)
                    skipBlank();
                else
                    skipBlank(*out_comments, out_strings->empty() ? nullptr : &out_strings->back());
            };

            for (;;) {
                blank();
                if (atEnd())
                    return fail("unterminated array", start);
                if (match("]"))
                    return true;

                if (out_strings != nullptr) {
                    if (peek() != '"' && peek() != '\'')
                        return fail("expected string in members array", position);
                    std::string value;
                    if (!scanString(value))
                        return false;
                    out_strings->push_back(std::move(value));
                }
                else if (!scanValue())
                    return false;

                blank();
                if (match(","))
                    continue;
                if (match("]"))
                    return true;
                return fail("expected `,' or `]' in array", position);
            }
        }

        bool TomlScanner::scanInlineTable() {
            auto const start = position;
            if (!match("{"))
                return fail("expected `{'", start);

            skipBlank();
            if (match("}"))
                return true;

            for (;;) {
                std::string key;
                if (!scanKey(key))
                    return false;
                if (!match("="))
                    return fail("expected `=' after key", position);
                skipSpaces();
                if (!scanValue())
                    return false;

                skipBlank();
                if (match("}"))
                    return true;
                if (!match(","))
                    return fail("expected `,' or `}' in inline table", position);
                skipBlank();
            }
        }

        bool TomlScanner::scanValue() {
            switch (peek()) {
            case '"':
            case '\'': {
                std::string ignored;
                return scanString(ignored);
            }
            case '[': return scanArray(nullptr);
            case '{': return scanInlineTable();
            default: break;
            }

            // numbers, booleans and dates run to the next delimiter
            auto const start = position;
            while (!atEnd() && std::string_view{ ",]}#\r\n" }.find(peek()) == std::string_view::npos)
                ++position;
            if (position == start)
                return fail("expected value", start);
            return true;
        }

        std::string escapeToml(std::string const& value) {
            std::string out;
            for (char const ch : value) {
                switch (ch) {
                case '"': out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n"; break;
                case '\t': out += "\\t"; break;
                case '\r': out += "\\r"; break;
                default: out.push_back(ch); break;
                }
            }
            return out;
        }

        class TomlManifest final : public SpliceManifest {
        public:
            explicit TomlManifest(std::string table) : table(std::move(table)) {}

            bool parse(std::string contents, fs::path const& filename, Log& log) override;

        protected:
            std::string render(std::vector<std::string> const& replacement) const override;

        private:
            std::string table;
            // the original `members = ' or `workspace.members = '
            std::string keyPrefix;
            bool inserting = false;
        };

        bool TomlManifest::parse(std::string contents, fs::path const& filename, Log& log) {
            text = std::move(contents);
            entries.clear();
            comments.clear();
            replaced = false;
            inserting = false;
            keyPrefix = "members = ";

            auto const memberKey = table + ".members";

            TomlScanner scan{ text };
            std::string currentTable;
            bool inArrayTable = false;
            bool inTable = false;
            bool foundTable = false;
            bool foundKey = false;
            size_t insertAt = 0;

            auto const failScan = [&] { return fail(filename, scan.failAt, log, scan.message); };

            for (;;) {
                scan.skipBlank();
                if (scan.atEnd())
                    break;

                auto const lineBegin = scan.position;
                bool header = false;

                if (scan.peek() == '[') {
                    bool const arrayTable = scan.match("[[");
                    if (!arrayTable)
                        scan.match("[");

                    std::string name;
                    if (!scan.scanKey(name))
                        return failScan();
                    if (!scan.match(arrayTable ? "]]" : "]"))
                        return fail(filename, scan.position, log, "expected `]' closing table header");

                    currentTable = name;
                    inArrayTable = arrayTable;
                    inTable = !arrayTable && name == table;
                    if (inTable) {
                        if (foundTable)
                            return fail(filename, lineBegin, log, "duplicate [" + table + "] table");
                        foundTable = true;
                    }
                    header = true;
                }
                else {
                    std::string key;
                    if (!scan.scanKey(key))
                        return failScan();
                    if (!scan.match("="))
                        return fail(filename, scan.position, log, "expected `=' after key `" + key + '\'');
                    scan.skipSpaces();

                    // members inside [table], or a dotted key such as workspace.members
                    auto const fullKey = currentTable.empty() ? key : currentTable + '.' + key;
                    if (!inArrayTable && fullKey == memberKey) {
                        if (foundKey)
                            return fail(filename, lineBegin, log, "duplicate `members' key in [" + table + ']');
                        if (scan.peek() != '[')
                            return fail(filename, scan.position, log, "`members' must be an array of strings");
                        keyPrefix = text.substr(lineBegin, scan.position - lineBegin);
                        if (!scan.scanArray(&entries, &comments))
                            return failScan();

                        sectionBegin = lineBegin;
                        sectionEnd = scan.position;
                        foundKey = true;
                    }
                    else if (!scan.scanValue())
                        return failScan();
                }

                scan.skipSpaces();
                scan.skipComment();
                if (!scan.atEnd() && !scan.match("\r\n") && !scan.match("\n"))
                    return fail(filename, scan.position, log, "expected end of line");

                if (header && inTable)
                    insertAt = scan.position;
            }

            if (foundKey)
                return true;

            if (!foundTable)
                return fail(filename, 0, log, "no [" + table + "] table");

            inserting = true;
            sectionBegin = sectionEnd = insertAt;
            return true;
        }

        std::string TomlManifest::render(std::vector<std::string> const& replacement) const {
            auto const newline = newlineOf(text);
            auto const indent = inserting ? std::string{} : indentationAt(text, sectionBegin);

            std::string out;
            if (inserting && sectionBegin == text.size() && !text.empty() && text.back() != '\n')
                out += newline;

            out += keyPrefix + '[';
            if (!replacement.empty() || !comments.lines.empty()) {
                out += newline;
                for (auto const& comment : comments.lines)
                    out += indent + "    " + comment + newline;
                for (auto const& entry : replacement) {
                    out += indent + "    \"" + escapeToml(entry) + "\",";
                    if (auto const* comment = comments.trailingFor(entry))
                        out += ' ' + *comment;
                    out += newline;
                }
                out += indent;
            }
            out += ']';

            if (inserting)
                out += newline;
            return out;
        }
    }

    std::unique_ptr<ManifestAdapter> createTomlManifest(std::string table) {
        return std::make_unique<TomlManifest>(std::move(table));
    }
}
