// modsync - schema module workspace synchronizer
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include "config.hh"
#include "location.hh"

#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace modsync {
    struct Log;

    // One workspace manifest format. parse() locates the members section; only
    // that section is touched by replaceMembers().
    class ManifestAdapter {
    public:
        virtual ~ManifestAdapter() = default;

        virtual bool parse(std::string text, std::filesystem::path const& filename, Log& log) = 0;
        virtual std::vector<std::string> const& members() const noexcept = 0;
        virtual void replaceMembers(std::vector<std::string> const& entries) = 0;
        virtual std::string serialize() const = 0;
    };

    // Comments found inside a members section. Whole-line comments are kept
    // at the head of the rewritten section; a comment on the same line as an
    // entry follows that entry while it stays a member.
    struct SectionComments {
        std::vector<std::string> lines;
        std::unordered_map<std::string, std::string> trailing;

        bool empty() const noexcept { return lines.empty() && trailing.empty(); }
        void clear() {
            lines.clear();
            trailing.clear();
        }
        std::string const* trailingFor(std::string const& entry) const;
    };

    // Base for text formats that are edited by splicing a rendered section
    // over the byte range of the original one.
    class SpliceManifest : public ManifestAdapter {
    public:
        std::vector<std::string> const& members() const noexcept final { return entries; }
        void replaceMembers(std::vector<std::string> const& replacement) final;
        std::string serialize() const final;

    protected:
        virtual std::string render(std::vector<std::string> const& replacement) const = 0;

        bool fail(std::filesystem::path const& filename, size_t offset, Log& log, std::string const& message) const;

        std::string text;
        std::vector<std::string> entries;
        SectionComments comments;
        size_t sectionBegin = 0;
        size_t sectionEnd = 0;
        std::string rendered;
        bool replaced = false;
    };

    std::unique_ptr<ManifestAdapter> createTomlManifest(std::string table);
    std::unique_ptr<ManifestAdapter> createGoWorkManifest(std::string directive);
    std::unique_ptr<ManifestAdapter> createXmlManifest(std::string element);
    std::unique_ptr<ManifestAdapter> createJsonManifest(std::string key);

    std::unique_ptr<ManifestAdapter> createManifestAdapter(Ecosystem const& eco);

    // "\r\n" when the text already uses it
    char const* newlineOf(std::string const& text) noexcept;

    // leading whitespace of the line holding offset, up to offset
    std::string indentationAt(std::string const& text, size_t offset);
}
