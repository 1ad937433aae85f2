// modsync - schema module workspace synchronizer
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "naming.hh"

#include <gtest/gtest.h>

using namespace modsync;

TEST(Naming, ModuleNameGrammar) {
    EXPECT_TRUE(isValidModuleName("idp"));
    EXPECT_TRUE(isValidModuleName("user-management"));
    EXPECT_TRUE(isValidModuleName("v2-api"));

    EXPECT_FALSE(isValidModuleName(""));
    EXPECT_FALSE(isValidModuleName("Core"));
    EXPECT_FALSE(isValidModuleName("2fa"));
    EXPECT_FALSE(isValidModuleName("-billing"));
    EXPECT_FALSE(isValidModuleName("user_management"));
    EXPECT_FALSE(isValidModuleName("user management"));
}

TEST(Naming, VersionGrammar) {
    EXPECT_TRUE(isValidVersion("v1"));
    EXPECT_TRUE(isValidVersion("v12"));

    EXPECT_FALSE(isValidVersion("v"));
    EXPECT_FALSE(isValidVersion("1"));
    EXPECT_FALSE(isValidVersion("V1"));
    EXPECT_FALSE(isValidVersion("v1beta"));
}

TEST(Naming, EntityGrammar) {
    EXPECT_TRUE(isValidEntityName("User"));
    EXPECT_TRUE(isValidEntityName("userProfile2"));

    EXPECT_FALSE(isValidEntityName(""));
    EXPECT_FALSE(isValidEntityName("9Lives"));
    EXPECT_FALSE(isValidEntityName("User_Profile"));
}

TEST(Naming, ModuleTransforms) {
    EXPECT_EQ("UserManagement", toTitleCase("user-management"));
    EXPECT_EQ("USER_MANAGEMENT", toUpperCase("user-management"));
    EXPECT_EQ("user_management", toSnakeCase("user-management"));
    EXPECT_EQ("user-management", toKebabCase("user-management"));

    EXPECT_EQ("Idp", toTitleCase("idp"));
    EXPECT_EQ("IDP", toUpperCase("idp"));
    EXPECT_EQ("idp", toSnakeCase("idp"));
}

TEST(Naming, KebabCaseNormalizes) {
    EXPECT_EQ("user-management", toKebabCase("User Management"));
    EXPECT_EQ("user-management", toKebabCase("user_management"));
    EXPECT_EQ("user-management", toKebabCase("UserManagement"));
    EXPECT_EQ("http-server", toKebabCase("HTTPServer"));
}

TEST(Naming, LowerCase) {
    EXPECT_EQ("service for billing", toLowerCase("Service for Billing"));
}

TEST(Naming, SplitWords) {
    EXPECT_EQ((std::vector<std::string>{ "user", "profile" }), splitWords("UserProfile"));
    EXPECT_EQ((std::vector<std::string>{ "http", "server" }), splitWords("HTTPServer"));
    EXPECT_EQ((std::vector<std::string>{ "api", "key" }), splitWords("api-key"));
    EXPECT_TRUE(splitWords("").empty());
}
