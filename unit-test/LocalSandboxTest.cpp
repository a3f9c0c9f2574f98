#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <filesystem>
#include "common/base64.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"
#include "runner/language.hpp"
#include "runner/normalizer.hpp"
#include "sandbox/local_sandbox.hpp"
#include "test/fake_toolchain.hpp"

using namespace std;
using namespace runner;
using namespace runner::sandbox;
namespace fs = std::filesystem;

class LocalSandboxTest : public ::testing::Test {
protected:
    runner::test::fake_toolchain fake;
    fs::path root;
    language_descriptor java;

    void SetUp() override {
        root = create_unique_directory(fs::temp_directory_path(), "workspaces-");
        java = language_table::defaults().at("java");
    }

    void TearDown() override {
        remove_directory_quietly(root);
    }

    local_sandbox make_sandbox() const {
        return local_sandbox(root, fake.tools());
    }

    static submission make_submission(const string &unit, const string &body = "") {
        submission submit;
        submit.language = "java";
        submit.entrypoint = unit + ".java";
        submit.files = {{unit + ".java", "public class " + unit + " {" + body + "}"}};
        submit.jars = {{"dep.jar", base64_encode("PK\x03\x04")}};
        return submit;
    }

    bool workspace_root_empty() const {
        return fs::is_empty(root);
    }

    vector<string> run_arguments() const {
        string content = read_file_content(fake.run_marker());
        vector<string> args;
        boost::split(args, content, boost::is_any_of("\n"));
        if (!args.empty() && args.back().empty()) args.pop_back();
        return args;
    }
};

TEST_F(LocalSandboxTest, RunTest) {
    auto result = normalize(make_sandbox().execute(make_submission("Main"), java));
    EXPECT_EQ(result.output, "ran Main\n");
    EXPECT_FALSE(result.error);
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(workspace_root_empty());
}

TEST_F(LocalSandboxTest, StdinTest) {
    auto submit = make_submission("Echo");
    submit.stdin_text = "3\n4\n";
    auto result = normalize(make_sandbox().execute(submit, java));
    EXPECT_EQ(result.output, "3\n4\n");
    EXPECT_TRUE(result.success);
}

TEST_F(LocalSandboxTest, CompileFailureTest) {
    auto raw = make_sandbox().execute(make_submission("Main", "SYNTAX ERROR"), java);
    EXPECT_EQ(raw.phase, local_run_result::phase_type::COMPILE);

    auto result = normalize(raw);
    EXPECT_EQ(result.output, "");
    ASSERT_TRUE(result.error);
    EXPECT_NE(result.error->find("error"), string::npos);
    EXPECT_FALSE(result.success);

    // 编译失败后不能运行
    EXPECT_FALSE(fs::exists(fake.run_marker()));
    EXPECT_TRUE(workspace_root_empty());
}

TEST_F(LocalSandboxTest, RunFailureTest) {
    auto result = normalize(make_sandbox().execute(make_submission("Fail"), java));
    EXPECT_EQ(result.error, optional<string>("boom\n"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.raw.at("exit_code"), 3);
    EXPECT_TRUE(workspace_root_empty());
}

TEST_F(LocalSandboxTest, TimeoutTest) {
    auto submit = make_submission("Sleeper");
    submit.timeout_seconds = 1;

    elapsed_time timer;
    auto result = normalize(make_sandbox().execute(submit, java));
    auto elapsed = timer.duration<chrono::milliseconds>().count();

    EXPECT_EQ(result.output, "");
    EXPECT_EQ(result.error, optional<string>("Execution timed out."));
    EXPECT_FALSE(result.success);
    EXPECT_LT(elapsed, 5000);
    EXPECT_TRUE(workspace_root_empty());
}

TEST_F(LocalSandboxTest, ClasspathTest) {
    auto submit = make_submission("Main");
    submit.jars = {{"gson.jar", base64_encode("PK\x03\x04")}, {"commons.jar", base64_encode("PK\x05\x06")}};
    auto result = normalize(make_sandbox().execute(submit, java));
    ASSERT_TRUE(result.success);

    auto args = run_arguments();
    ASSERT_EQ(args.size(), 3u);
    EXPECT_EQ(args[0], "-cp");
    EXPECT_EQ(args[2], "Main");

    vector<string> classpath;
    boost::split(classpath, args[1], boost::is_any_of(":"));
    ASSERT_EQ(classpath.size(), 3u);
    fs::path workdir = classpath[2];
    EXPECT_EQ(workdir.parent_path(), root);
    EXPECT_EQ(fs::path(classpath[0]), workdir / "gson.jar");
    EXPECT_EQ(fs::path(classpath[1]), workdir / "commons.jar");
}

TEST_F(LocalSandboxTest, UnsafeFileNameTest) {
    auto submit = make_submission("Main");
    submit.files.emplace_back("../evil.txt", "pwned");
    EXPECT_THROW(make_sandbox().execute(submit, java), invalid_submission);
    EXPECT_TRUE(workspace_root_empty());
    EXPECT_FALSE(fs::exists(root.parent_path() / "evil.txt"));

    submit = make_submission("Main");
    submit.jars = {{"/tmp/evil.jar", base64_encode("PK")}};
    EXPECT_THROW(make_sandbox().execute(submit, java), invalid_submission);

    submit = make_submission("Main");
    submit.entrypoint = "../Main.java";
    EXPECT_THROW(make_sandbox().execute(submit, java), invalid_submission);
    EXPECT_TRUE(workspace_root_empty());
}

TEST_F(LocalSandboxTest, InvalidJarTest) {
    auto submit = make_submission("Main");
    submit.jars = {{"dep.jar", "this is not base64"}};
    EXPECT_THROW(make_sandbox().execute(submit, java), invalid_submission);

    submit = make_submission("Main");
    submit.jars = {{"Main.java", base64_encode("PK")}};
    EXPECT_THROW(make_sandbox().execute(submit, java), invalid_submission);
    EXPECT_TRUE(workspace_root_empty());
}

TEST_F(LocalSandboxTest, NoSourceFileTest) {
    auto submit = make_submission("Main");
    submit.files = {{"README.md", "# Main"}};
    EXPECT_THROW(make_sandbox().execute(submit, java), invalid_submission);
    EXPECT_TRUE(workspace_root_empty());
}

TEST_F(LocalSandboxTest, MissingCompilerTest) {
    toolchain tools = fake.tools();
    tools.compiler = "/nonexistent/javac";
    local_sandbox sandbox(root, tools);
    auto result = normalize(sandbox.execute(make_submission("Main"), java));
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error);
    EXPECT_NE(result.error->find("failed to execute"), string::npos);
    EXPECT_TRUE(workspace_root_empty());
}

TEST(RunnableUnitNameTest, StripExtensionTest) {
    EXPECT_EQ(runnable_unit_name("Main.java", ".java"), "Main");
    EXPECT_EQ(runnable_unit_name("Main", ".java"), "Main");
    EXPECT_EQ(runnable_unit_name(".java", ".java"), ".java");
    EXPECT_EQ(runnable_unit_name("Main.java", ""), "Main.java");
}

TEST(JdkTest, CompileAndRunTest) {
    if (find_executable("javac").empty() || find_executable("java").empty())
        GTEST_SKIP() << "javac is not available";

    auto root = create_unique_directory(fs::temp_directory_path(), "workspaces-");
    local_sandbox sandbox(root, toolchain());
    auto java = language_table::defaults().at("java");

    submission submit;
    submit.language = "java";
    submit.entrypoint = "Main.java";
    submit.files = {{"Main.java", R"(import java.util.Scanner;
public class Main {
    public static void main(String[] args) {
        Scanner in = new Scanner(System.in);
        System.out.println(in.nextInt() + Adder.ZERO + in.nextInt());
    }
})"},
                    {"Adder.java", "public class Adder { public static final int ZERO = 0; }"}};
    submit.stdin_text = "3\n4\n";
    submit.timeout_seconds = 30;

    auto result = normalize(sandbox.execute(submit, java));
    bool empty = fs::is_empty(root);
    remove_directory_quietly(root);

    EXPECT_EQ(result.output, "7\n");
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(empty);
}
