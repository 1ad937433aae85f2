// modsync - schema module workspace synchronizer
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "manifest.hh"
#include "log.hh"

#include <string_view>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace modsync {
    namespace {
        using JsonT = nlohmann::ordered_json;

        struct Member {
            bool found = false;
            size_t keyBegin = 0;
            size_t valueBegin = 0;
            size_t valueEnd = 0;
        };

        // Walks the raw text of a document nlohmann has already accepted, so
        // malformed input is not a concern here; it only measures byte ranges.
        struct JsonScanner {
            std::string_view source;
            size_t position = 0;
            size_t lastKeyBegin = 0;

            char peek() const noexcept { return position < source.size() ? source[position] : '\0'; }

            void skipSpace() {
                while (position < source.size() && std::string_view{ " \t\r\n" }.find(source[position]) != std::string_view::npos)
                    ++position;
            }

            void skipString() {
                for (++position; position < source.size(); ++position) {
                    if (source[position] == '\\')
                        ++position;
                    else if (source[position] == '"') {
                        ++position;
                        return;
                    }
                }
            }

            void skipValue() {
                auto const ch = peek();
                if (ch == '"') {
                    skipString();
                    return;
                }
                if (ch != '{' && ch != '[') {
                    while (position < source.size() && std::string_view{ ",}] \t\r\n" }.find(source[position]) == std::string_view::npos)
                        ++position;
                    return;
                }

                int depth = 0;
                while (position < source.size()) {
                    auto const c = source[position];
                    if (c == '"') {
                        skipString();
                        continue;
                    }
                    ++position;
                    if (c == '{' || c == '[')
                        ++depth;
                    else if ((c == '}' || c == ']') && --depth == 0)
                        return;
                }
            }

            // Finds the last occurrence of name among the members of the
            // object starting at objectBegin. out_lastValueEnd is the end of
            // the final member's value, or npos for an empty object.
            Member findMember(size_t objectBegin, std::string_view name, size_t& out_lastValueEnd) {
                Member member;
                out_lastValueEnd = std::string_view::npos;

                position = objectBegin + 1;
                for (;;) {
                    skipSpace();
                    if (peek() != '"')
                        return member;

                    auto const keyBegin = position;
                    skipString();
                    auto const key = JsonT::parse(std::string{ source.substr(keyBegin, position - keyBegin) }).get<std::string>();
                    lastKeyBegin = keyBegin;

                    skipSpace();
                    ++position; // ':'
                    skipSpace();

                    auto const valueBegin = position;
                    skipValue();
                    out_lastValueEnd = position;

                    if (key == name)
                        member = Member{ true, keyBegin, valueBegin, position };

                    skipSpace();
                    if (peek() != ',')
                        return member;
                    ++position;
                }
            }
        };

        std::string quote(std::string const& value) {
            return JsonT(value).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }

        // Only the members array is rewritten; every other byte of the
        // document is kept as it was.
        class JsonManifest final : public SpliceManifest {
        public:
            explicit JsonManifest(std::string key) : key(std::move(key)) {}

            bool parse(std::string contents, fs::path const& filename, Log& log) override;

        protected:
            std::string render(std::vector<std::string> const& replacement) const override;

        private:
            std::string key;
            // one indentation level, as used by the document
            std::string indentUnit = "  ";
            // indentation of the line holding the key
            std::string keyIndent;
            bool multiline = true;
            bool inserting = false;
            bool emptyObject = false;
        };

        bool JsonManifest::parse(std::string contents, fs::path const& filename, Log& log) {
            text = std::move(contents);
            entries.clear();
            comments.clear();
            replaced = false;
            inserting = false;
            emptyObject = false;
            indentUnit = "  ";

            JsonT doc;
            try {
                doc = JsonT::parse(text);
            }
            catch (nlohmann::json::parse_error const& e) {
                auto const offset = e.byte > 0 ? e.byte - 1 : 0;
                return log.error(Location{ filename, positionAt(text, offset) }, "malformed JSON: ", e.what());
            }

            Location const loc{ filename };
            if (!doc.is_object())
                return log.error(loc, "document must be a JSON object");

            auto const newline = text.find('\n');
            if (newline != std::string::npos) {
                auto const first = text.find_first_not_of(" \t", newline + 1);
                if (first != std::string::npos && first > newline + 1)
                    indentUnit = text.substr(newline + 1, first - (newline + 1));
            }

            JsonScanner scan{ text };
            scan.skipSpace();
            auto const rootBegin = scan.position;

            size_t lastValueEnd = 0;
            auto member = scan.findMember(rootBegin, key, lastValueEnd);

            if (!member.found) {
                // the key is appended after the last member
                inserting = true;
                multiline = newline != std::string::npos;
                emptyObject = lastValueEnd == std::string_view::npos;
                sectionBegin = sectionEnd = emptyObject ? rootBegin + 1 : lastValueEnd;
                // the blank space inside `{ }' is replaced
                if (emptyObject)
                    sectionEnd = scan.position;
                keyIndent = emptyObject ? indentUnit : indentationAt(text, scan.lastKeyBegin);
                return true;
            }

            JsonT const* list = &*doc.find(key);
            if (list->is_object()) {
                auto const packages = list->find("packages");
                if (packages == list->end())
                    return log.error(Location{ filename, positionAt(text, member.keyBegin) }, '`', key, "' object has no `packages' array");
                list = &*packages;

                size_t nestedLast = 0;
                member = scan.findMember(member.valueBegin, "packages", nestedLast);
            }

            if (!list->is_array())
                return log.error(Location{ filename, positionAt(text, member.valueBegin) }, '`', key, "' must be an array of strings");

            for (auto const& entry : *list) {
                if (!entry.is_string())
                    return log.error(Location{ filename, positionAt(text, member.valueBegin) }, '`', key, "' contains a non-string entry: ", entry.dump());
                entries.push_back(entry.get<std::string>());
            }

            sectionBegin = member.valueBegin;
            sectionEnd = member.valueEnd;
            keyIndent = indentationAt(text, member.keyBegin);
            multiline = text.find('\n', sectionBegin) < sectionEnd || (entries.empty() && newline != std::string::npos);
            return true;
        }

        std::string JsonManifest::render(std::vector<std::string> const& replacement) const {
            auto const newline = newlineOf(text);

            std::string array;
            if (replacement.empty())
                array = "[]";
            else if (!multiline) {
                array = "[";
                for (size_t index = 0; index != replacement.size(); ++index) {
                    if (index != 0)
                        array += ", ";
                    array += quote(replacement[index]);
                }
                array += ']';
            }
            else {
                array = std::string{ "[" } + newline;
                for (size_t index = 0; index != replacement.size(); ++index) {
                    array += keyIndent + indentUnit + quote(replacement[index]);
                    if (index + 1 != replacement.size())
                        array += ',';
                    array += newline;
                }
                array += keyIndent + ']';
            }

            if (!inserting)
                return array;

            auto const member = quote(key) + ": " + array;
            if (!multiline)
                return (emptyObject ? "" : ", ") + member;
            if (emptyObject)
                return newline + keyIndent + member + newline;
            return ',' + (newline + keyIndent) + member;
        }
    }

    std::unique_ptr<ManifestAdapter> createJsonManifest(std::string key) {
        return std::make_unique<JsonManifest>(std::move(key));
    }
}
