// modsync - schema module workspace synchronizer
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "manifest.hh"
#include "log.hh"

namespace modsync {
    std::string const* SectionComments::trailingFor(std::string const& entry) const {
        auto const it = trailing.find(entry);
        return it != trailing.end() ? &it->second : nullptr;
    }

    void SpliceManifest::replaceMembers(std::vector<std::string> const& replacement) {
        rendered = render(replacement);
        entries = replacement;
        replaced = true;
    }

    std::string SpliceManifest::serialize() const {
        if (!replaced)
            return text;

        std::string result;
        result.reserve(text.size() + rendered.size());
        result.append(text, 0, sectionBegin);
        result += rendered;
        result.append(text, sectionEnd, std::string::npos);
        return result;
    }

    bool SpliceManifest::fail(std::filesystem::path const& filename, size_t offset, Log& log, std::string const& message) const {
        return log.error(Location{ filename, positionAt(text, offset) }, message);
    }

    std::unique_ptr<ManifestAdapter> createManifestAdapter(Ecosystem const& eco) {
        switch (eco.format) {
        case ManifestFormat::Toml: return createTomlManifest(eco.section);
        case ManifestFormat::GoWork: return createGoWorkManifest(eco.section);
        case ManifestFormat::Xml: return createXmlManifest(eco.section);
        case ManifestFormat::Json: return createJsonManifest(eco.section);
        default: return nullptr;
        }
    }

    char const* newlineOf(std::string const& text) noexcept {
        return text.find("\r\n") != std::string::npos ? "\r\n" : "\n";
    }

    std::string indentationAt(std::string const& text, size_t offset) {
        auto const lineStart = offset == 0 ? std::string::npos : text.rfind('\n', offset - 1);
        auto const begin = lineStart == std::string::npos ? 0 : lineStart + 1;

        std::string indent;
        for (auto index = begin; index < offset && (text[index] == ' ' || text[index] == '\t'); ++index)
            indent.push_back(text[index]);
        return indent;
    }
}
