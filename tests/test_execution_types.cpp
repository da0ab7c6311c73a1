#include "warden/core/execution_types.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace warden::core;

TEST(ExecutionTypesTest, ModeFollowsTarget) {
    ExecutionRequest request;
    request.target = ShellTarget{"ls"};
    EXPECT_EQ(request.mode(), ExecutionMode::SHELL_RUN);
    request.target = LibraryTarget{"tools.math", std::nullopt, "add"};
    EXPECT_EQ(request.mode(), ExecutionMode::LIBRARY_CALL);
    EXPECT_EQ(ExecutionModeToString(ExecutionMode::MODULE_CALL), "module_call");
    EXPECT_EQ(ExecutionModeFromString("script_run"), ExecutionMode::SCRIPT_RUN);
    EXPECT_THROW(ExecutionModeFromString("eval"), std::invalid_argument);
}

TEST(ExecutionTypesTest, LibraryRequestSurvivesJson) {
    ExecutionRequest request;
    request.target = LibraryTarget{"tools.math", std::string("Calculator"), "add"};
    request.args = {1, 2};
    request.kwargs = {{"precise", true}};
    request.working_directory = "/srv/ws";
    request.search_paths = {"/srv/ws/lib"};
    request.limits.cpu_time_seconds = 5;
    request.limits.memory_bytes = 64 * 1024 * 1024;
    request.limits.allowed_paths = {"/srv/ws"};
    request.enforce_allowlist = true;
    request.control_directory = "/srv/ws/.sandbox";

    auto j = nlohmann::json(request);
    EXPECT_EQ(j.at("mode"), "library_call");
    EXPECT_EQ(j.at("target").at("class_name"), "Calculator");

    auto parsed = j.get<ExecutionRequest>();
    const auto& target = std::get<LibraryTarget>(parsed.target);
    EXPECT_EQ(target.module, "tools.math");
    ASSERT_TRUE(target.class_name.has_value());
    EXPECT_EQ(*target.class_name, "Calculator");
    EXPECT_EQ(parsed.args, nlohmann::json({1, 2}));
    EXPECT_EQ(parsed.kwargs.at("precise"), true);
    EXPECT_EQ(parsed.working_directory->string(), "/srv/ws");
    EXPECT_EQ(parsed.limits.cpu_time_seconds, 5u);
    EXPECT_EQ(parsed.limits.memory_bytes, 64u * 1024 * 1024);
    EXPECT_TRUE(parsed.enforce_allowlist);
    EXPECT_FALSE(parsed.install_command.has_value());
}

TEST(ExecutionTypesTest, ScriptRequestKeepsArgumentsAndInstallCommand) {
    ExecutionRequest request;
    request.target = ScriptTarget{"/ws/run.sh", {"--epochs", "3"}};
    request.dependencies = {"npm:left-pad", "requests"};
    request.install_command = "make deps";

    auto parsed = nlohmann::json(request).get<ExecutionRequest>();
    const auto& script = std::get<ScriptTarget>(parsed.target);
    EXPECT_EQ(script.script_path.string(), "/ws/run.sh");
    EXPECT_EQ(script.arguments, (std::vector<std::string>{"--epochs", "3"}));
    EXPECT_EQ(parsed.dependencies.size(), 2u);
    EXPECT_EQ(parsed.install_command.value_or(""), "make deps");
    EXPECT_FALSE(parsed.working_directory.has_value());
}

TEST(ExecutionTypesTest, ErrorResultCarriesMessageAndTrace) {
    auto failure = ExecutionResult::Failure("boom", "std::runtime_error: boom\n", "partial output");
    auto j = nlohmann::json(failure);
    EXPECT_EQ(j.at("status"), "error");
    EXPECT_FALSE(j.contains("result"));

    auto parsed = j.get<ExecutionResult>();
    EXPECT_FALSE(parsed.ok());
    EXPECT_EQ(parsed.error_message, "boom");
    EXPECT_EQ(parsed.captured_output, "partial output");
}

TEST(ExecutionTypesTest, UnknownStatusIsRejected) {
    nlohmann::json j = {{"status", "maybe"}};
    EXPECT_THROW(j.get<ExecutionResult>(), std::invalid_argument);
}

TEST(ExecutionTypesTest, EnvelopeWriteIsAtomicAndReadable) {
    warden::testing::TempDir dir;
    auto path = dir.path() / "response.json";
    WriteEnvelope(path, nlohmann::json(ExecutionResult::Success(42)));

    EXPECT_FALSE(std::filesystem::exists(dir.path() / "response.json.tmp"));
    auto result = ReadEnvelope(path).get<ExecutionResult>();
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.result, 42);
}

TEST(ExecutionTypesTest, EnvelopeReplacesInvalidUtf8) {
    warden::testing::TempDir dir;
    auto path = dir.path() / "response.json";
    ASSERT_NO_THROW(WriteEnvelope(path, nlohmann::json(ExecutionResult::Success(
        nlohmann::json(), std::string("ok\xff\n")))));

    auto result = ReadEnvelope(path).get<ExecutionResult>();
    EXPECT_EQ(result.captured_output, "ok\xEF\xBF\xBD\n");
}

TEST(ExecutionTypesTest, ReadEnvelopeReportsMissingAndMalformed) {
    warden::testing::TempDir dir;
    EXPECT_THROW(ReadEnvelope(dir.path() / "absent.json"), std::runtime_error);

    auto broken = dir.Write("broken.json", "{\"status\": ");
    try {
        ReadEnvelope(broken);
        FAIL() << "expected malformed artifact error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("Malformed artifact"), std::string::npos);
    }
}
