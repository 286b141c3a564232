#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>
#include "compile.h"
#include "shell_command_runner.h"

namespace fs = std::filesystem;

// Runs parse_options on `args`, with a program name in front.
static ErrorCode parse(std::vector<std::string> args, CompilerOptions *opts) {
    args.insert(args.begin(), "math-compiler");
    std::vector<char *> argv;
    for (auto &arg: args) {
        argv.push_back(&arg[0]);
    }
    argv.push_back(nullptr);
    return parse_options(static_cast<int>(args.size()), argv.data(), opts);
}

TEST(ParseOptionsTest, Defaults) {
    CompilerOptions opts;
    ASSERT_EQ(parse({"3 4 +"}, &opts), ERR_OK);
    EXPECT_EQ(opts.expression, "3 4 +");
    EXPECT_FALSE(opts.compile);
    EXPECT_FALSE(opts.run);
    EXPECT_FALSE(opts.debug);
    EXPECT_FALSE(opts.save_asm);
    EXPECT_FALSE(opts.show_tokens);
    EXPECT_FALSE(opts.show_ir);
    EXPECT_EQ(opts.output_name, "a.out");
}

TEST(ParseOptionsTest, Flags) {
    CompilerOptions opts;
    ASSERT_EQ(parse({"--debug", "--show-tokens", "--show-ir", "--compile", "--save-asm",
                     "--filename", "calc", "1 2 +"}, &opts), ERR_OK);
    EXPECT_TRUE(opts.debug);
    EXPECT_TRUE(opts.show_tokens);
    EXPECT_TRUE(opts.show_ir);
    EXPECT_TRUE(opts.compile);
    EXPECT_TRUE(opts.save_asm);
    EXPECT_FALSE(opts.run);
    EXPECT_EQ(opts.output_name, "calc");
    EXPECT_EQ(opts.expression, "1 2 +");
}

TEST(ParseOptionsTest, RunImpliesCompile) {
    CompilerOptions opts;
    ASSERT_EQ(parse({"--run", "3 4 +"}, &opts), ERR_OK);
    EXPECT_TRUE(opts.run);
    EXPECT_TRUE(opts.compile);
}

TEST(ParseOptionsTest, NegativeNumberIsAnExpression) {
    CompilerOptions opts;
    ASSERT_EQ(parse({"-3"}, &opts), ERR_OK);
    EXPECT_EQ(opts.expression, "-3");
}

TEST(ParseOptionsTest, UnknownOption) {
    CompilerOptions opts;
    EXPECT_EQ(parse({"--x", "3 4 +"}, &opts), ERR_UNKNOWN_OPTION);
}

TEST(ParseOptionsTest, SecondExpression) {
    CompilerOptions opts;
    EXPECT_EQ(parse({"3 4 +", "5 6 +"}, &opts), ERR_USAGE);
}

TEST(ParseOptionsTest, FilenameWithoutValue) {
    CompilerOptions opts;
    EXPECT_EQ(parse({"3 4 +", "--filename"}, &opts), ERR_USAGE);
}

TEST(ParseOptionsTest, MissingExpression) {
    CompilerOptions none;
    EXPECT_EQ(parse({}, &none), ERR_NO_EXPRESSION);
    CompilerOptions empty;
    EXPECT_EQ(parse({""}, &empty), ERR_NO_EXPRESSION);
    CompilerOptions flagsOnly;
    EXPECT_EQ(parse({"--compile"}, &flagsOnly), ERR_NO_EXPRESSION);
}

TEST(ShellCommandRunnerTest, Quote) {
    EXPECT_EQ(shell_quote("abc"), "'abc'");
    EXPECT_EQ(shell_quote("a b"), "'a b'");
    EXPECT_EQ(shell_quote("a'b"), "'a'\\''b'");
    EXPECT_EQ(shell_quote(""), "''");
}

TEST(ShellCommandRunnerTest, ReportsExitStatus) {
    EXPECT_EQ(run_command("true"), 0);

    testing::internal::CaptureStderr();
    int code = run_command("exit 3");
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_EQ(code, 3);
    EXPECT_EQ(err, "Error: exit 3 exited with status 3\n");
}

TEST(ShellCommandRunnerTest, QuotedCommandIsReportedAsIs) {
    testing::internal::CaptureStderr();
    int code = run_command(shell_quote("/nonexistent/math-compiler-program"));
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_NE(code, 0);
    EXPECT_NE(err.find("Error: '/nonexistent/math-compiler-program' exited with status"), std::string::npos) << err;
    EXPECT_EQ(err.find("''"), std::string::npos) << err;
}

TEST(CompileExpressionTest, RejectedExpression) {
    CompilerOptions opts;
    opts.expression = "3 foo +";
    testing::internal::CaptureStderr();
    EXPECT_EQ(compile_expression(opts), ERR_COMPILE);
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("Unknown token 'foo'"), std::string::npos) << err;
}

TEST(CompileExpressionTest, PrintsAssembly) {
    CompilerOptions opts;
    opts.expression = "3 4 +";
    testing::internal::CaptureStdout();
    EXPECT_EQ(compile_expression(opts), ERR_OK);
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_NE(out.find(".intel_syntax noprefix\n"), std::string::npos);
    EXPECT_NE(out.find("\n\t# [PLUS]\n"), std::string::npos);
}

TEST(CompileExpressionTest, StatusLinePrecedesProgramOutput) {
#if defined(__x86_64__) && defined(__linux__)
    if (std::system("gcc --version > /dev/null 2>&1") != 0) {
        GTEST_SKIP() << "gcc is not available";
    }
#else
    GTEST_SKIP() << "generated code targets x86-64 Linux";
#endif
    fs::path dir = fs::temp_directory_path() / ("math-compiler-driver-" + std::to_string(getpid()));
    fs::create_directories(dir);

    CompilerOptions opts;
    opts.expression = "3 4 +";
    opts.compile = true;
    opts.run = true;
    opts.output_name = (dir / "program").string();

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    ErrorCode code = compile_expression(opts);
    std::string out = testing::internal::GetCapturedStdout();
    std::string err = testing::internal::GetCapturedStderr();

    bool assembled = fs::exists(dir / "program");
    EXPECT_FALSE(fs::exists(dir / "program.s"));
    fs::remove_all(dir);
    if (code == ERR_ASSEMBLE) {
        GTEST_SKIP() << "static linking is not available: " << err;
    }

    ASSERT_EQ(code, ERR_OK) << err;
    EXPECT_TRUE(assembled);
    EXPECT_EQ(out, "Generated executable " + opts.output_name + "\nResult 7\n");
}
