// modsync - schema module workspace synchronizer
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "log.hh"
#include "manifest.hh"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

using namespace modsync;

namespace {
    using Entries = std::vector<std::string>;

    std::string rewrite(ManifestAdapter& adapter, std::string const& text, Entries const& entries) {
        Log log;
        EXPECT_TRUE(adapter.parse(text, "manifest", log)) << (log.lines.empty() ? "" : log.lines.front());
        adapter.replaceMembers(entries);
        return adapter.serialize();
    }

    bool rejects(ManifestAdapter& adapter, std::string const& text) {
        Log log;
        auto const ok = adapter.parse(text, "manifest", log);
        return !ok && log.failed();
    }
}

TEST(TomlManifest, ReadsMembers) {
    auto adapter = createTomlManifest("workspace");
    Log log;
    ASSERT_TRUE(adapter->parse(
        "[workspace]\n"
        "resolver = \"2\"\n"
        "members = [\n"
        "    \"core\",   # shared types\n"
        "    'idp'\n"
        "]\n",
        "Cargo.toml", log));
    EXPECT_EQ((Entries{ "core", "idp" }), adapter->members());
}

TEST(TomlManifest, ReplacesOnlyMembers) {
    auto adapter = createTomlManifest("workspace");
    auto const result = rewrite(*adapter,
        "# workspace root\n"
        "[workspace]\n"
        "resolver = \"2\"\n"
        "members = [\n"
        "    \"core\",\n"
        "    \"old\",\n"
        "]\n"
        "\n"
        "[workspace.dependencies]\n"
        "prost = { version = \"0.12\", features = [\"std\"] }\n",
        { "core", "idp" });

    EXPECT_EQ(
        "# workspace root\n"
        "[workspace]\n"
        "resolver = \"2\"\n"
        "members = [\n"
        "    \"core\",\n"
        "    \"idp\",\n"
        "]\n"
        "\n"
        "[workspace.dependencies]\n"
        "prost = { version = \"0.12\", features = [\"std\"] }\n",
        result);
}

TEST(TomlManifest, DottedTable) {
    auto adapter = createTomlManifest("tool.uv.workspace");
    auto const result = rewrite(*adapter,
        "[project]\n"
        "name = \"clients\"\n"
        "members = [\"not-this-one\"]\n"
        "\n"
        "[tool.uv.workspace]\n"
        "members = [\"core\"]\n",
        { "core", "idp" });

    EXPECT_EQ(
        "[project]\n"
        "name = \"clients\"\n"
        "members = [\"not-this-one\"]\n"
        "\n"
        "[tool.uv.workspace]\n"
        "members = [\n"
        "    \"core\",\n"
        "    \"idp\",\n"
        "]\n",
        result);
}

TEST(TomlManifest, InsertsMissingKey) {
    auto adapter = createTomlManifest("workspace");
    auto const result = rewrite(*adapter,
        "[workspace]\n"
        "resolver = \"2\"\n",
        { "core" });

    EXPECT_EQ(
        "[workspace]\n"
        "members = [\n"
        "    \"core\",\n"
        "]\n"
        "resolver = \"2\"\n",
        result);
}

TEST(TomlManifest, EmptyMembers) {
    auto adapter = createTomlManifest("workspace");
    EXPECT_EQ("[workspace]\nmembers = []\n", rewrite(*adapter, "[workspace]\nmembers = [\"a\"]\n", {}));
}

TEST(TomlManifest, KeepsComments) {
    auto adapter = createTomlManifest("workspace");
    EXPECT_EQ(
        "[workspace]\n"
        "members = [\n"
        "    # generated by the build\n"
        "    \"core\", # shared types\n"
        "    \"idp\",\n"
        "]\n",
        rewrite(*adapter,
            "[workspace]\n"
            "members = [\n"
            "    # generated by the build\n"
            "    \"core\",   # shared types\n"
            "    \"old\",\n"
            "]\n",
            { "core", "idp" }));
}

TEST(TomlManifest, DottedMembersKey) {
    auto adapter = createTomlManifest("workspace");
    EXPECT_EQ(
        "workspace.members = [\n"
        "    \"core\",\n"
        "    \"idp\",\n"
        "]\n"
        "\n"
        "[workspace.dependencies]\n"
        "prost = \"0.12\"\n",
        rewrite(*adapter,
            "workspace.members = [\"core\"]\n"
            "\n"
            "[workspace.dependencies]\n"
            "prost = \"0.12\"\n",
            { "core", "idp" }));

    auto nested = createTomlManifest("tool.uv.workspace");
    Log log;
    ASSERT_TRUE(nested->parse("[tool]\nuv.workspace.members = [\"core\", 'idp']\n", "pyproject.toml", log));
    EXPECT_EQ((Entries{ "core", "idp" }), nested->members());
}

TEST(TomlManifest, Errors) {
    EXPECT_TRUE(rejects(*createTomlManifest("workspace"), "[package]\nname = \"x\"\n"));
    EXPECT_TRUE(rejects(*createTomlManifest("workspace"), "[workspace]\nmembers = [1, 2]\n"));
    EXPECT_TRUE(rejects(*createTomlManifest("workspace"), "[workspace]\nmembers = \"core\"\n"));
    EXPECT_TRUE(rejects(*createTomlManifest("workspace"), "[workspace]\nmembers = [\"core\"\n"));
    EXPECT_TRUE(rejects(*createTomlManifest("workspace"), "[workspace]\nmembers = []\nmembers = []\n"));
    EXPECT_TRUE(rejects(*createTomlManifest("workspace"), "[workspace]\n[workspace]\n"));
}

TEST(TomlManifest, ErrorNamesLine) {
    auto adapter = createTomlManifest("workspace");
    Log log;
    EXPECT_FALSE(adapter->parse("[workspace]\nmembers = [\n    42,\n]\n", "Cargo.toml", log));
    ASSERT_FALSE(log.lines.empty());
    EXPECT_NE(std::string::npos, log.lines.front().find("Cargo.toml(3,5)"));
}

TEST(TomlManifest, ArrayTablesAreNotTheSection) {
    EXPECT_TRUE(rejects(*createTomlManifest("workspace"), "[[workspace]]\nmembers = []\n"));
}

TEST(GoWorkManifest, ReplacesUseBlock) {
    auto adapter = createGoWorkManifest("use");
    auto const result = rewrite(*adapter,
        "go 1.22\n"
        "\n"
        "use (\n"
        "\t./core\n"
        "\t./old // legacy\n"
        ")\n"
        "\n"
        "replace example.com/x => ./x\n",
        { "./core", "./idp" });

    EXPECT_EQ(
        "go 1.22\n"
        "\n"
        "use (\n"
        "\t./core\n"
        "\t./idp\n"
        ")\n"
        "\n"
        "replace example.com/x => ./x\n",
        result);
}

TEST(GoWorkManifest, KeepsComments) {
    auto adapter = createGoWorkManifest("use");
    EXPECT_EQ(
        "go 1.22\n"
        "\n"
        "use (\n"
        "\t// ./legacy\n"
        "\t./core // shared\n"
        "\t./idp\n"
        ")\n",
        rewrite(*adapter,
            "go 1.22\n"
            "\n"
            "use (\n"
            "\t./core // shared\n"
            "\t// ./legacy\n"
            ")\n",
            { "./core", "./idp" }));
}

TEST(GoWorkManifest, SingleUseDirective) {
    auto adapter = createGoWorkManifest("use");
    Log log;
    ASSERT_TRUE(adapter->parse("go 1.22\n\nuse ./core\n", "go.work", log));
    EXPECT_EQ((Entries{ "./core" }), adapter->members());

    adapter->replaceMembers({ "./core", "./idp" });
    EXPECT_EQ("go 1.22\n\nuse (\n\t./core\n\t./idp\n)\n", adapter->serialize());
}

TEST(GoWorkManifest, InsertsAfterGoDirective) {
    auto adapter = createGoWorkManifest("use");
    EXPECT_EQ("go 1.22\n\nuse (\n\t./core\n)\n", rewrite(*adapter, "go 1.22\n", { "./core" }));
}

TEST(GoWorkManifest, SkipsOtherBlocks) {
    auto adapter = createGoWorkManifest("use");
    Log log;
    ASSERT_TRUE(adapter->parse(
        "go 1.22\n"
        "\n"
        "replace (\n"
        "\tuse => ./x\n"
        ")\n"
        "\n"
        "use ./core\n",
        "go.work", log));
    EXPECT_EQ((Entries{ "./core" }), adapter->members());
}

TEST(GoWorkManifest, Errors) {
    EXPECT_TRUE(rejects(*createGoWorkManifest("use"), "go 1.22\nuse ./a\nuse ./b\n"));
    EXPECT_TRUE(rejects(*createGoWorkManifest("use"), "go 1.22\nuse (\n\t./a\n"));
    EXPECT_TRUE(rejects(*createGoWorkManifest("use"), "toolchain go1.22.1\n"));
}

TEST(XmlManifest, ReplacesTopLevelModules) {
    auto adapter = createXmlManifest("modules");
    auto const result = rewrite(*adapter,
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<project>\n"
        "    <!-- <modules><module>commented</module></modules> -->\n"
        "    <modelVersion>4.0.0</modelVersion>\n"
        "    <modules>\n"
        "        <module>core</module>\n"
        "        <module>old</module>\n"
        "    </modules>\n"
        "    <profiles>\n"
        "        <profile>\n"
        "            <modules>\n"
        "                <module>extra</module>\n"
        "            </modules>\n"
        "        </profile>\n"
        "    </profiles>\n"
        "</project>\n",
        { "core", "idp" });

    EXPECT_EQ(
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<project>\n"
        "    <!-- <modules><module>commented</module></modules> -->\n"
        "    <modelVersion>4.0.0</modelVersion>\n"
        "    <modules>\n"
        "        <module>core</module>\n"
        "        <module>idp</module>\n"
        "    </modules>\n"
        "    <profiles>\n"
        "        <profile>\n"
        "            <modules>\n"
        "                <module>extra</module>\n"
        "            </modules>\n"
        "        </profile>\n"
        "    </profiles>\n"
        "</project>\n",
        result);
}

TEST(XmlManifest, ExpandsEmptyElement) {
    auto adapter = createXmlManifest("modules");
    EXPECT_EQ(
        "<project>\n"
        "  <modules>\n"
        "    <module>core</module>\n"
        "  </modules>\n"
        "</project>\n",
        rewrite(*adapter, "<project>\n  <modules/>\n</project>\n", { "core" }));
}

TEST(XmlManifest, EmptyElementFollowsParentIndent) {
    auto adapter = createXmlManifest("modules");
    EXPECT_EQ(
        "<project>\n"
        "  <modelVersion>4.0.0</modelVersion>\n"
        "  <modules>\n"
        "    <module>core</module>\n"
        "    <module>idp</module>\n"
        "  </modules>\n"
        "</project>\n",
        rewrite(*adapter,
            "<project>\n"
            "  <modelVersion>4.0.0</modelVersion>\n"
            "  <modules></modules>\n"
            "</project>\n",
            { "core", "idp" }));

    auto tabbed = createXmlManifest("modules");
    EXPECT_EQ("<project>\n\t<modules>\n\t\t<module>core</module>\n\t</modules>\n</project>\n",
        rewrite(*tabbed, "<project>\n\t<modules></modules>\n</project>\n", { "core" }));
}

TEST(XmlManifest, KeepsCommentsInModules) {
    auto adapter = createXmlManifest("modules");
    EXPECT_EQ(
        "<project>\n"
        "  <modules>\n"
        "    <!-- keep -->\n"
        "    <module>core</module>\n"
        "    <module>idp</module>\n"
        "  </modules>\n"
        "</project>\n",
        rewrite(*adapter,
            "<project>\n"
            "  <modules>\n"
            "    <!-- keep -->\n"
            "    <module>core</module>\n"
            "  </modules>\n"
            "</project>\n",
            { "core", "idp" }));

    auto emptied = createXmlManifest("modules");
    EXPECT_EQ("<project>\n  <modules>\n    <!-- keep -->\n  </modules>\n</project>\n",
        rewrite(*emptied, "<project>\n  <modules>\n    <!-- keep -->\n    <module>core</module>\n  </modules>\n</project>\n", {}));
}

TEST(XmlManifest, Errors) {
    EXPECT_TRUE(rejects(*createXmlManifest("modules"), "<project>\n</project>\n"));
    EXPECT_TRUE(rejects(*createXmlManifest("modules"), "<project>\n<modules>\n<module>core</module>\n"));
    EXPECT_TRUE(rejects(*createXmlManifest("modules"), "<project><modules><artifact>x</artifact></modules></project>"));
    EXPECT_TRUE(rejects(*createXmlManifest("modules"), "<project><!-- unterminated </project>"));
}

TEST(JsonManifest, ReplacesWorkspaces) {
    auto adapter = createJsonManifest("workspaces");
    auto const result = rewrite(*adapter,
        "{\n"
        "  \"name\": \"clients\",\n"
        "  \"private\": true,\n"
        "  \"workspaces\": [\n"
        "    \"packages/old\"\n"
        "  ],\n"
        "  \"devDependencies\": {\n"
        "    \"typescript\": \"^5.0.0\"\n"
        "  }\n"
        "}\n",
        { "packages/validate", "packages/core" });

    EXPECT_EQ(
        "{\n"
        "  \"name\": \"clients\",\n"
        "  \"private\": true,\n"
        "  \"workspaces\": [\n"
        "    \"packages/validate\",\n"
        "    \"packages/core\"\n"
        "  ],\n"
        "  \"devDependencies\": {\n"
        "    \"typescript\": \"^5.0.0\"\n"
        "  }\n"
        "}\n",
        result);
}

TEST(JsonManifest, KeepsFourSpaceIndent) {
    auto adapter = createJsonManifest("workspaces");
    EXPECT_EQ(
        "{\n"
        "    \"workspaces\": [\n"
        "        \"packages/core\"\n"
        "    ]\n"
        "}",
        rewrite(*adapter, "{\n    \"workspaces\": []\n}", { "packages/core" }));
}

TEST(JsonManifest, YarnPackages) {
    auto adapter = createJsonManifest("workspaces");
    auto const result = rewrite(*adapter,
        "{\n  \"workspaces\": {\n    \"packages\": [\"packages/a\"],\n    \"nohoist\": [\"**/x\"]\n  }\n}\n",
        { "packages/core" });

    auto const doc = nlohmann::ordered_json::parse(result);
    EXPECT_EQ((Entries{ "packages/core" }), doc["workspaces"]["packages"].get<Entries>());
    EXPECT_EQ((Entries{ "**/x" }), doc["workspaces"]["nohoist"].get<Entries>());
}

TEST(JsonManifest, AddsMissingKey) {
    auto adapter = createJsonManifest("workspaces");
    Log log;
    ASSERT_TRUE(adapter->parse("{\n  \"name\": \"clients\"\n}\n", "package.json", log));
    EXPECT_TRUE(adapter->members().empty());

    adapter->replaceMembers({ "packages/core" });
    EXPECT_EQ("{\n  \"name\": \"clients\",\n  \"workspaces\": [\n    \"packages/core\"\n  ]\n}\n", adapter->serialize());
}

TEST(JsonManifest, KeepsOtherBytes) {
    std::string const prefix =
        "{\n"
        "  \"name\" : \"clients\",\n"
        "  \"description\": \"caf\\u00e9 \\/ bar\",\n"
        "  \"files\": [\"dist\"],\n"
        "  \"limits\": { \"size\": 1e3, \"ratio\": 0.50 },\n"
        "  \"engines\": { \"node\": \">=18\" },\n"
        "  \"workspaces\": ";
    std::string const suffix =
        ",\n"
        "  \"scripts\": {\"build\":\"tsc -b\"}\n"
        "}\n";

    auto adapter = createJsonManifest("workspaces");
    auto const result = rewrite(*adapter, prefix + "[\"packages/old\"]" + suffix, { "packages/core", "packages/idp" });
    EXPECT_EQ(prefix + "[\"packages/core\", \"packages/idp\"]" + suffix, result);
}

TEST(JsonManifest, AddsKeyToEmptyObject) {
    auto adapter = createJsonManifest("workspaces");
    EXPECT_EQ("{\n  \"workspaces\": [\n    \"packages/core\"\n  ]\n}\n", rewrite(*adapter, "{\n}\n", { "packages/core" }));

    auto compact = createJsonManifest("workspaces");
    EXPECT_EQ("{\"name\":\"x\", \"workspaces\": [\"packages/core\"]}", rewrite(*compact, "{\"name\":\"x\"}", { "packages/core" }));
}

TEST(JsonManifest, Errors) {
    EXPECT_TRUE(rejects(*createJsonManifest("workspaces"), "{ \"workspaces\": [1] }"));
    EXPECT_TRUE(rejects(*createJsonManifest("workspaces"), "{ \"workspaces\": \"packages/*\" }"));
    EXPECT_TRUE(rejects(*createJsonManifest("workspaces"), "{ \"workspaces\": [ }"));
    EXPECT_TRUE(rejects(*createJsonManifest("workspaces"), "[]"));
}

TEST(Manifest, UnchangedWithoutReplace) {
    std::string const text = "[workspace]\nmembers = [ \"core\" ]   # keep\n";
    auto adapter = createTomlManifest("workspace");
    Log log;
    ASSERT_TRUE(adapter->parse(text, "Cargo.toml", log));
    EXPECT_EQ(text, adapter->serialize());
}

TEST(Manifest, IndentationAt) {
    EXPECT_EQ("    ", indentationAt("a\n    <modules>", 6));
    EXPECT_EQ("\t", indentationAt("\tx", 1));
    EXPECT_EQ("", indentationAt("x", 0));
}
