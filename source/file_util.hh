// modsync - schema module workspace synchronizer
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

namespace modsync {
    inline bool loadText(std::filesystem::path const& filename, std::string& out_text) {
        // open file and read contents
        std::ifstream stream(filename, std::ios::binary);
        if (!stream)
            return false;

        std::ostringstream buffer;
        buffer << stream.rdbuf();
        stream.close();
        out_text = buffer.str();
        return true;
    }

    // Writes text next to the target and renames it into place, so the target
    // either keeps its old contents or receives all of the new ones.
    inline bool writeTextStaged(std::filesystem::path const& filename, std::string const& text, std::string& out_error) {
        namespace fs = std::filesystem;

        auto staged = filename;
        staged += ".modsync-tmp";

        {
            std::ofstream stream(staged, std::ios::binary | std::ios::trunc);
            if (!stream) {
                out_error = "failed to open '" + staged.string() + "' for writing";
                return false;
            }

            stream << text;
            stream.flush();
            if (!stream) {
                stream.close();
                std::error_code ignored;
                fs::remove(staged, ignored);
                out_error = "failed to write '" + staged.string() + '\'';
                return false;
            }
        }

        std::error_code ec;
        auto const status = fs::status(filename, ec);
        if (!ec && fs::exists(status))
            fs::permissions(staged, status.permissions(), fs::perm_options::replace, ec);

        fs::rename(staged, filename, ec);
        if (ec) {
            out_error = "failed to replace '" + filename.string() + "': " + ec.message();
            std::error_code ignored;
            fs::remove(staged, ignored);
            return false;
        }

        return true;
    }
}
