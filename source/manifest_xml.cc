// modsync - schema module workspace synchronizer
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "manifest.hh"
#include "log.hh"
#include "string_util.hh"

#include <string_view>
#include <utility>

namespace fs = std::filesystem;

namespace modsync {
    namespace {
        auto isNameChar(char ch) -> bool {
            return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '_' || ch == '-' || ch == '.' || ch == ':';
        }

        std::string escapeXml(std::string const& value) {
            std::string out;
            for (char const ch : value) {
                switch (ch) {
                case '&': out += "&amp;"; break;
                case '<': out += "&lt;"; break;
                case '>': out += "&gt;"; break;
                case '"': out += "&quot;"; break;
                default: out.push_back(ch); break;
                }
            }
            return out;
        }

        std::string unescapeXml(std::string_view value) {
            static constexpr std::pair<std::string_view, char> entities[] = {
                { "&amp;", '&' },
                { "&lt;", '<' },
                { "&gt;", '>' },
                { "&quot;", '"' },
                { "&apos;", '\'' },
            };

            std::string out;
            for (size_t index = 0; index != value.size();) {
                bool matched = false;
                if (value[index] == '&') {
                    for (auto [entity, ch] : entities) {
                        if (value.substr(index, entity.size()) == entity) {
                            out.push_back(ch);
                            index += entity.size();
                            matched = true;
                            break;
                        }
                    }
                }
                if (!matched)
                    out.push_back(value[index++]);
            }
            return out;
        }

        // the singular child name: modules -> module
        std::string childNameOf(std::string const& element) {
            if (element.size() > 1 && element.back() == 's')
                return element.substr(0, element.size() - 1);
            return "module";
        }

        struct Tag {
            enum class Kind {
                Open,
                Close,
                Empty,
                Skip,
            } kind = Kind::Skip;
            std::string name;
            size_t begin = 0;
            size_t end = 0;
        };

        class XmlManifest final : public SpliceManifest {
        public:
            explicit XmlManifest(std::string element) : element(std::move(element)), child(childNameOf(this->element)) {}

            bool parse(std::string contents, fs::path const& filename, Log& log) override;

        protected:
            std::string render(std::vector<std::string> const& replacement) const override;

        private:
            bool nextTag(size_t& position, Tag& out_tag, fs::path const& filename, Log& log) const;
            bool scanChildren(size_t position, fs::path const& filename, Log& log);

            std::string element;
            std::string child;
            std::string childIndent;
            // indentation of the document element's line
            std::string parentIndent;
        };

        // reads the markup starting at the next `<'; comments, processing
        // instructions, CDATA and declarations come back as Skip
        bool XmlManifest::nextTag(size_t& position, Tag& out_tag, fs::path const& filename, Log& log) const {
            auto const begin = text.find('<', position);
            if (begin == std::string::npos) {
                position = text.size();
                out_tag.begin = out_tag.end = position;
                out_tag.kind = Tag::Kind::Skip;
                out_tag.name.clear();
                return true;
            }

            out_tag.begin = begin;
            out_tag.name.clear();

            auto const skipTo = [&](std::string_view terminator, char const* what) {
                auto const end = text.find(terminator, begin);
                if (end == std::string::npos)
                    return fail(filename, begin, log, std::string{ "unterminated " } + what);
                out_tag.kind = Tag::Kind::Skip;
                out_tag.end = position = end + terminator.size();
                return true;
            };

            std::string_view const rest{ text.data() + begin, text.size() - begin };
            if (starts_with(rest, "<!--"))
                return skipTo("-->", "comment");
            if (starts_with(rest, "<![CDATA["))
                return skipTo("]]>", "CDATA section");
            if (starts_with(rest, "<?"))
                return skipTo("?>", "processing instruction");
            if (starts_with(rest, "<!"))
                return skipTo(">", "declaration");

            auto index = begin + 1;
            bool const closing = index < text.size() && text[index] == '/';
            if (closing)
                ++index;

            auto const nameStart = index;
            while (index < text.size() && isNameChar(text[index]))
                ++index;
            if (index == nameStart)
                return fail(filename, begin, log, "malformed tag");
            out_tag.name = text.substr(nameStart, index - nameStart);

            // find the closing `>', stepping over quoted attribute values
            char quote = 0;
            for (; index < text.size(); ++index) {
                auto const ch = text[index];
                if (quote != 0) {
                    if (ch == quote)
                        quote = 0;
                }
                else if (ch == '"' || ch == '\'')
                    quote = ch;
                else if (ch == '>')
                    break;
            }
            if (index >= text.size())
                return fail(filename, begin, log, "unterminated tag <" + out_tag.name + '>');

            if (closing)
                out_tag.kind = Tag::Kind::Close;
            else if (text[index - 1] == '/')
                out_tag.kind = Tag::Kind::Empty;
            else
                out_tag.kind = Tag::Kind::Open;

            out_tag.end = position = index + 1;
            return true;
        }

        bool XmlManifest::parse(std::string contents, fs::path const& filename, Log& log) {
            text = std::move(contents);
            entries.clear();
            comments.clear();
            childIndent.clear();
            parentIndent.clear();
            replaced = false;

            std::vector<std::string> stack;
            size_t position = 0;
            Tag tag;

            while (position < text.size()) {
                if (!nextTag(position, tag, filename, log))
                    return false;

                switch (tag.kind) {
                case Tag::Kind::Skip:
                    break;
                case Tag::Kind::Close:
                    if (stack.empty() || stack.back() != tag.name)
                        return fail(filename, tag.begin, log, "mismatched closing tag </" + tag.name + '>');
                    stack.pop_back();
                    break;
                case Tag::Kind::Empty:
                case Tag::Kind::Open:
                    // only the section directly inside the document element is owned;
                    // the same element inside profiles belongs to the user
                    if (tag.name == element && stack.size() == 1) {
                        sectionBegin = tag.begin;
                        if (tag.kind == Tag::Kind::Empty) {
                            sectionEnd = tag.end;
                            return true;
                        }
                        return scanChildren(tag.end, filename, log);
                    }
                    if (tag.kind == Tag::Kind::Open) {
                        if (stack.empty())
                            parentIndent = indentationAt(text, tag.begin);
                        stack.push_back(tag.name);
                    }
                    break;
                }
            }

            return fail(filename, 0, log, "no <" + element + "> element in the document element");
        }

        bool XmlManifest::scanChildren(size_t position, fs::path const& filename, Log& log) {
            Tag tag;
            for (;;) {
                auto const textStart = position;
                if (!nextTag(position, tag, filename, log))
                    return false;

                if (!trim(std::string_view{ text }.substr(textStart, tag.begin - textStart)).empty())
                    return fail(filename, textStart, log, "unexpected text in <" + element + '>');

                if (tag.end >= text.size() && tag.name.empty())
                    return fail(filename, sectionBegin, log, "unterminated <" + element + "> element");

                switch (tag.kind) {
                case Tag::Kind::Skip:
                    if (starts_with(std::string_view{ text }.substr(tag.begin), "<!--"))
                        comments.lines.push_back(text.substr(tag.begin, tag.end - tag.begin));
                    break;
                case Tag::Kind::Close:
                    if (tag.name != element)
                        return fail(filename, tag.begin, log, "mismatched closing tag </" + tag.name + '>');
                    sectionEnd = tag.end;
                    return true;
                case Tag::Kind::Empty:
                    return fail(filename, tag.begin, log, "empty <" + tag.name + "/> in <" + element + '>');
                case Tag::Kind::Open: {
                    if (tag.name != child)
                        return fail(filename, tag.begin, log, "unexpected <" + tag.name + "> in <" + element + '>');

                    auto const closeTag = "</" + child;
                    auto const close = text.find(closeTag, tag.end);
                    if (close == std::string::npos)
                        return fail(filename, tag.begin, log, "unterminated <" + child + '>');
                    auto const closeEnd = text.find('>', close);
                    if (closeEnd == std::string::npos)
                        return fail(filename, close, log, "unterminated </" + child + '>');

                    auto const value = trim(std::string_view{ text }.substr(tag.end, close - tag.end));
                    if (value.find('<') != std::string_view::npos)
                        return fail(filename, tag.end, log, "<" + child + "> must contain only text");
                    entries.push_back(unescapeXml(value));

                    if (childIndent.empty()) {
                        auto const indent = indentationAt(text, tag.begin);
                        auto const lineStart = tag.begin - indent.size();
                        if (lineStart == 0 || text[lineStart - 1] == '\n')
                            childIndent = indent;
                    }

                    position = closeEnd + 1;
                    break;
                }
                }
            }
        }

        std::string XmlManifest::render(std::vector<std::string> const& replacement) const {
            if (replacement.empty() && comments.lines.empty())
                return '<' + element + "/>";

            auto const newline = newlineOf(text);
            auto const openIndent = indentationAt(text, sectionBegin);
            auto indent = childIndent;
            if (indent.empty()) {
                // one more step of whatever separates <element> from its parent
                std::string step = openIndent.find('\t') != std::string::npos ? "\t" : "    ";
                if (openIndent.size() > parentIndent.size() && starts_with(openIndent, parentIndent))
                    step = openIndent.substr(parentIndent.size());
                indent = openIndent + step;
            }

            std::string out = '<' + element + '>' + newline;
            for (auto const& comment : comments.lines)
                out += indent + comment + newline;
            for (auto const& entry : replacement)
                out += indent + '<' + child + '>' + escapeXml(entry) + "</" + child + '>' + newline;
            out += openIndent + "</" + element + '>';
            return out;
        }
    }

    std::unique_ptr<ManifestAdapter> createXmlManifest(std::string element) {
        return std::make_unique<XmlManifest>(std::move(element));
    }
}
