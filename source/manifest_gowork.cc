// modsync - schema module workspace synchronizer
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "manifest.hh"
#include "log.hh"
#include "string_util.hh"

#include <string_view>

namespace fs = std::filesystem;

namespace modsync {
    namespace {
        // drops a trailing // comment, ignoring any inside quoted paths
        std::string_view stripComment(std::string_view line) {
            char quote = 0;
            for (size_t index = 0; index != line.size(); ++index) {
                auto const ch = line[index];
                if (quote != 0) {
                    if (ch == '\\' && quote == '"')
                        ++index;
                    else if (ch == quote)
                        quote = 0;
                }
                else if (ch == '"' || ch == '`')
                    quote = ch;
                else if (ch == '/' && index + 1 < line.size() && line[index + 1] == '/')
                    return line.substr(0, index);
            }
            return line;
        }

        // the `// ...' part stripComment() removes, trimmed
        std::string_view commentOf(std::string_view line) {
            return trim(line.substr(stripComment(line).size()));
        }

        bool isDirective(std::string_view line, std::string_view keyword) {
            if (!starts_with(line, keyword))
                return false;
            if (line.size() == keyword.size())
                return true;
            auto const next = line[keyword.size()];
            return next == ' ' || next == '\t' || next == '(';
        }

        bool unquote(std::string_view token, std::string& out) {
            if (token.size() >= 2 && token.front() == '`' && token.back() == '`') {
                out.assign(token.substr(1, token.size() - 2));
                return true;
            }
            if (token.empty() || token.front() != '"') {
                out.assign(token);
                return token.find_first_of(" \t\"") == std::string_view::npos;
            }
            if (token.size() < 2 || token.back() != '"')
                return false;

            out.clear();
            for (size_t index = 1; index + 1 < token.size(); ++index) {
                if (token[index] == '\\' && index + 2 < token.size())
                    ++index;
                out.push_back(token[index]);
            }
            return true;
        }

        std::string quoteIfNeeded(std::string const& path) {
            if (path.find_first_of(" \t\"\\`") == std::string::npos)
                return path;

            std::string out = "\"";
            for (char const ch : path) {
                if (ch == '"' || ch == '\\')
                    out.push_back('\\');
                out.push_back(ch);
            }
            out.push_back('"');
            return out;
        }

        class GoWorkManifest final : public SpliceManifest {
        public:
            explicit GoWorkManifest(std::string directive) : directive(std::move(directive)) {}

            bool parse(std::string contents, fs::path const& filename, Log& log) override;

        protected:
            std::string render(std::vector<std::string> const& replacement) const override;

        private:
            std::string directive;
            bool inserting = false;
        };

        bool GoWorkManifest::parse(std::string contents, fs::path const& filename, Log& log) {
            text = std::move(contents);
            entries.clear();
            comments.clear();
            replaced = false;
            inserting = false;

            std::string_view const source{ text };
            auto const offsetOf = [&source](std::string_view part) { return static_cast<size_t>(part.data() - source.data()); };

            size_t position = 0;
            auto const nextLine = [&]() -> std::string_view {
                auto lineEnd = source.find('\n', position);
                if (lineEnd == std::string_view::npos)
                    lineEnd = source.size();
                auto const line = source.substr(position, lineEnd - position);
                position = lineEnd < source.size() ? lineEnd + 1 : lineEnd;
                return line;
            };

            bool found = false;
            bool inOtherBlock = false;
            size_t goDirectiveEnd = std::string::npos;

            while (position < source.size()) {
                auto const line = nextLine();
                auto const code = trim(stripComment(line));

                if (inOtherBlock) {
                    if (code == ")")
                        inOtherBlock = false;
                    continue;
                }

                if (!isDirective(code, directive)) {
                    if (isDirective(code, "go")) {
                        auto const content = trim(line);
                        goDirectiveEnd = offsetOf(content) + content.size();
                    }
                    else if (!code.empty() && code.back() == '(')
                        inOtherBlock = true;
                    continue;
                }

                if (found)
                    return fail(filename, offsetOf(code), log, "multiple `" + directive + "' directives");
                found = true;
                sectionBegin = offsetOf(code);

                auto const rest = trim(code.substr(directive.size()));
                if (rest.empty())
                    return fail(filename, offsetOf(code), log, "expected path or `(' after `" + directive + '\'');

                if (rest.front() != '(') {
                    std::string path;
                    if (!unquote(rest, path))
                        return fail(filename, offsetOf(rest), log, "malformed path `" + std::string{ rest } + '\'');
                    entries.push_back(std::move(path));
                    sectionEnd = offsetOf(rest) + rest.size();
                    continue;
                }

                auto const inner = trim(rest.substr(1));
                if (inner == ")") {
                    sectionEnd = offsetOf(inner) + 1;
                    continue;
                }
                if (!inner.empty())
                    return fail(filename, offsetOf(inner), log, "expected line break after `('");

                bool closed = false;
                while (!closed && position < source.size()) {
                    auto const entryLine = nextLine();
                    auto const entry = trim(stripComment(entryLine));
                    auto const comment = commentOf(entryLine);
                    if (entry.empty()) {
                        if (!comment.empty())
                            comments.lines.emplace_back(comment);
                        continue;
                    }
                    if (entry == ")") {
                        sectionEnd = offsetOf(entry) + 1;
                        closed = true;
                        continue;
                    }

                    std::string path;
                    if (!unquote(entry, path))
                        return fail(filename, offsetOf(entry), log, "malformed path `" + std::string{ entry } + '\'');
                    if (!comment.empty())
                        comments.trailing[path] = std::string{ comment };
                    entries.push_back(std::move(path));
                }

                if (!closed)
                    return fail(filename, sectionBegin, log, "unterminated `" + directive + "' block");
            }

            if (!found) {
                if (goDirectiveEnd == std::string::npos)
                    return fail(filename, 0, log, "no `" + directive + "' or `go' directive");
                inserting = true;
                sectionBegin = sectionEnd = goDirectiveEnd;
            }

            return true;
        }

        std::string GoWorkManifest::render(std::vector<std::string> const& replacement) const {
            auto const newline = newlineOf(text);

            std::string out;
            if (inserting)
                out = std::string{ newline } + newline;

            out += directive;
            if (replacement.empty() && comments.lines.empty())
                return out + " ()";

            out += " (";
            out += newline;
            for (auto const& comment : comments.lines)
                out += '\t' + comment + newline;
            for (auto const& entry : replacement) {
                out += '\t' + quoteIfNeeded(entry);
                if (auto const* comment = comments.trailingFor(entry))
                    out += ' ' + *comment;
                out += newline;
            }
            out += ')';
            return out;
        }
    }

    std::unique_ptr<ManifestAdapter> createGoWorkManifest(std::string directive) {
        return std::make_unique<GoWorkManifest>(std::move(directive));
    }
}
