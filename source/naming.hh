// modsync - schema module workspace synchronizer
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace modsync {
    // ^[a-z][a-z0-9-]*$
    bool isValidModuleName(std::string_view name) noexcept;
    // ^v[0-9]+$
    bool isValidVersion(std::string_view version) noexcept;
    // ^[A-Za-z][A-Za-z0-9]*$
    bool isValidEntityName(std::string_view name) noexcept;

    // user-management -> UserManagement
    std::string toTitleCase(std::string_view name);
    // user-management -> USER_MANAGEMENT
    std::string toUpperCase(std::string_view name);
    // user-management -> user_management
    std::string toSnakeCase(std::string_view name);
    // User Management, user_management, UserManagement -> user-management
    std::string toKebabCase(std::string_view name);
    std::string toLowerCase(std::string_view text);

    // splits CamelCase and separator-delimited names into lowercase words
    std::vector<std::string> splitWords(std::string_view name);
}
