// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * Toolgate a resilient tool-serving process.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <expected>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/Context.hpp"
#include "common/Error.hpp"
#include "common/Subprocess.hpp"
#include "tools/DocLookupTool.hpp"

using toolgate::Context;
using toolgate::DocLookupTool;
using toolgate::Error;
using toolgate::ErrorCode;
using toolgate::ProcessResult;
using nlohmann::json;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Return;

namespace {
    using RunnerMock = ::testing::MockFunction<std::expected<ProcessResult, Error>(
        const Context&, const std::vector<std::string>&, const std::string&)>;

    class DocLookupToolTest : public ::testing::Test {
    protected:
        RunnerMock runner;
        DocLookupTool tool {"go", "/work", runner.AsStdFunction()};
        const Context ctx {};
    };
} // namespace

TEST_F(DocLookupToolTest, Metadata) {
    EXPECT_EQ(tool.name(), "go-doc");
    EXPECT_EQ(tool.description(), "Get Go documentation for a package or symbol");
    const auto schema = tool.inputSchema();
    EXPECT_EQ(schema["type"], "object");
    EXPECT_EQ(schema["required"], json::array({"package_path"}));
    EXPECT_TRUE(schema["properties"].contains("symbol_name"));
}

TEST_F(DocLookupToolTest, BuildsCommand) {
    EXPECT_THAT(tool.command("fmt", ""), ElementsAre("go", "doc", "fmt"));
    EXPECT_THAT(tool.command("net/http", "Client.Do"), ElementsAre("go", "doc", "net/http.Client.Do"));
}

TEST_F(DocLookupToolTest, ReturnsTrimmedOutput) {
    EXPECT_CALL(runner, Call(_, ElementsAre("go", "doc", "fmt.Println"), "/work"))
        .WillOnce(Return(ProcessResult {0, "\nfunc Println(a ...any) (n int, err error)\n\n"}));
    auto result = tool.call(ctx, json {{"package_path", "fmt"}, {"symbol_name", "Println"}});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->at("text"), "func Println(a ...any) (n int, err error)");
    EXPECT_EQ(result->at("package_path"), "fmt");
    EXPECT_EQ(result->at("symbol_name"), "Println");
}

TEST_F(DocLookupToolTest, RequestedWorkingDirWins) {
    EXPECT_CALL(runner, Call(_, _, "/srv/project"))
        .WillOnce(Return(ProcessResult {0, "package strings"}));
    auto result = tool.call(ctx, json {{"package_path", "strings"}, {"working_dir", "/srv/project"}});
    ASSERT_TRUE(result.has_value());
}

TEST_F(DocLookupToolTest, ClassifiesFailures) {
    EXPECT_CALL(runner, Call(_, _, _))
        .WillOnce(Return(ProcessResult {1, "doc: no symbol Foo in package fmt\nexit status 1"}))
        .WillOnce(Return(ProcessResult {127, ""}))
        .WillOnce(Return(ProcessResult {2, "go: internal error"}));

    auto notFound = tool.call(ctx, json {{"package_path", "fmt"}, {"symbol_name", "Foo"}});
    ASSERT_FALSE(notFound.has_value());
    EXPECT_EQ(notFound.error().code, ErrorCode::NotFound);
    EXPECT_EQ(notFound.error().what, "go doc failed: exit status 1\nOutput: doc: no symbol Foo in package fmt\nexit status 1");

    auto missing = tool.call(ctx, json {{"package_path", "fmt"}});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::Unavailable);
    EXPECT_EQ(missing.error().what, "go doc failed: exit status 127");

    auto broken = tool.call(ctx, json {{"package_path", "fmt"}});
    ASSERT_FALSE(broken.has_value());
    EXPECT_EQ(broken.error().code, ErrorCode::ToolFailure);
}

TEST_F(DocLookupToolTest, PropagatesRunnerErrors) {
    EXPECT_CALL(runner, Call(_, _, _))
        .WillOnce(Return(std::unexpected {Error {ErrorCode::Timeout, "context deadline exceeded"}}));
    auto result = tool.call(ctx, json {{"package_path", "fmt"}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Timeout);
}

TEST_F(DocLookupToolTest, InvalidArgumentsNeverRun) {
    EXPECT_CALL(runner, Call(_, _, _)).Times(0);
    EXPECT_EQ(tool.validate(json::array()).error().what, "arguments must be an object");
    EXPECT_EQ(tool.validate(json::object()).error().what, "package_path is required");
    EXPECT_EQ(tool.validate(json {{"package_path", "../etc"}}).error().what, "package path cannot contain '..'");
    EXPECT_EQ(tool.validate(json {{"package_path", "fmt"}, {"symbol_name", "Print ln"}}).error().what,
        "invalid Go symbol name: Print ln");
    EXPECT_EQ(tool.validate(json {{"package_path", "fmt"}, {"working_dir", "/tmp/$HOME"}}).error().what,
        "file path contains invalid characters");
    EXPECT_EQ(tool.validate(json {{"package_path", 42}}).error().code, ErrorCode::InvalidArg);
    auto result = tool.call(ctx, json {{"package_path", "fmt; rm -rf /"}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArg);
}

TEST(DocLookupValidationTest, PackagePaths) {
    EXPECT_TRUE(toolgate::validatePackagePath("fmt").has_value());
    EXPECT_TRUE(toolgate::validatePackagePath("net/http").has_value());
    EXPECT_TRUE(toolgate::validatePackagePath("github.com/user/repo/pkg").has_value());
    EXPECT_TRUE(toolgate::validatePackagePath("golang.org/x/tools").has_value());
    EXPECT_EQ(toolgate::validatePackagePath("").error().what, "package path cannot be empty");
    EXPECT_EQ(toolgate::validatePackagePath("   ").error().what, "package path cannot be empty");
    EXPECT_EQ(toolgate::validatePackagePath("fmt;ls").error().what, "invalid Go package path format: fmt;ls");
    EXPECT_FALSE(toolgate::validatePackagePath("/abs/path").has_value());
    EXPECT_FALSE(toolgate::validatePackagePath("net//http").has_value());
}

TEST(DocLookupValidationTest, SymbolNames) {
    EXPECT_TRUE(toolgate::validateSymbolName("").has_value());
    EXPECT_TRUE(toolgate::validateSymbolName("Println").has_value());
    EXPECT_TRUE(toolgate::validateSymbolName("Client.Do").has_value());
    EXPECT_TRUE(toolgate::validateSymbolName("_private").has_value());
    EXPECT_FALSE(toolgate::validateSymbolName("1abc").has_value());
    EXPECT_FALSE(toolgate::validateSymbolName("A.B.C").has_value());
    EXPECT_FALSE(toolgate::validateSymbolName("Foo()").has_value());
}

TEST(DocLookupValidationTest, FilePaths) {
    EXPECT_TRUE(toolgate::validateFilePath("").has_value());
    EXPECT_TRUE(toolgate::validateFilePath("/home/user/project").has_value());
    EXPECT_TRUE(toolgate::validateFilePath("src/pkg-name_v2").has_value());
    EXPECT_EQ(toolgate::validateFilePath("a/../b").error().what, "file path cannot contain '..'");
    EXPECT_EQ(toolgate::validateFilePath(std::string {"a\0b", 3}).error().what, "file path cannot contain null bytes");
    EXPECT_FALSE(toolgate::validateFilePath("dir with space").has_value());
}

TEST(DocLookupValidationTest, FindsEnclosingModule) {
    namespace fs = std::filesystem;
    const auto root = fs::temp_directory_path() / "toolgate_find_go_module";
    fs::remove_all(root);
    fs::create_directories(root / "a" / "b");
    std::ofstream {root / "go.mod"} << "module example.com/m\n";
    EXPECT_EQ(toolgate::findGoModule((root / "a" / "b").string()), fs::absolute(root).string());
    EXPECT_EQ(toolgate::findGoModule(root.string()), fs::absolute(root).string());
    fs::remove_all(root);
}

TEST(DocLookupValidationTest, ConstructorRejectsEmptyBinary) {
    EXPECT_THROW(DocLookupTool(""), std::invalid_argument);
    EXPECT_THROW(DocLookupTool("go", "", nullptr), std::invalid_argument);
}
