#include <filesystem>
#include "common/base64.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "runner/dispatcher.hpp"
#include "test/fake_toolchain.hpp"
#include "test/mock_transport.hpp"

using namespace std;
using namespace runner;
using namespace testing;
namespace fs = std::filesystem;

static const string ENDPOINT = "https://judge.example.com/submissions/?base64_encoded=true&wait=true";

class DispatcherTest : public ::testing::Test {
protected:
    language_table languages = language_table::defaults();
    runner::test::fake_toolchain fake;
    fs::path root;
    unique_ptr<sandbox::local_sandbox> local;
    remote::mock::mock_transport transport;
    unique_ptr<remote::judge_client> client;
    unique_ptr<dispatcher> dispatch;

    void SetUp() override {
        root = create_unique_directory(fs::temp_directory_path(), "workspaces-");
        local = make_unique<sandbox::local_sandbox>(root, fake.tools());
        client = make_unique<remote::judge_client>(ENDPOINT, transport);
        dispatch = make_unique<dispatcher>(languages, *local, *client);
    }

    void TearDown() override {
        remove_directory_quietly(root);
    }

    static submission java_submission() {
        submission submit;
        submit.language = "java";
        submit.entrypoint = "Main.java";
        submit.files = {{"Main.java", "public class Main {}"}, {"Util.java", "class Util {}"}};
        return submit;
    }
};

TEST_F(DispatcherTest, UnsupportedLanguageTest) {
    EXPECT_CALL(transport, post(_, _, _, _)).Times(0);

    auto submit = java_submission();
    submit.language = "cobol";
    EXPECT_THROW(dispatch->dispatch(submit), unsupported_language_error);

    submit.jars = {{"dep.jar", base64_encode("PK")}};
    EXPECT_THROW(dispatch->dispatch(submit), unsupported_language_error);

    EXPECT_TRUE(fs::is_empty(root));
    EXPECT_FALSE(fs::exists(fake.run_marker()));
}

TEST_F(DispatcherTest, RemoteTest) {
    string body;
    EXPECT_CALL(transport, post(ENDPOINT, _, _, chrono::seconds(3)))
        .WillOnce(DoAll(SaveArg<2>(&body), Return(remote::mock::judge0_response("7\n"))));

    submission submit;
    submit.language = "Python";
    submit.entrypoint = "main.py";
    submit.files = {{"main.py", "import util"}, {"util.py", "print(7)"}};
    submit.timeout_seconds = 3;
    auto result = dispatch->dispatch(submit);

    EXPECT_EQ(result.output, "7\n");
    EXPECT_TRUE(result.success);

    auto payload = nlohmann::json::parse(body);
    EXPECT_EQ(payload.at("language_id").get<int>(), 71);
    EXPECT_EQ(base64_decode(payload.at("source_code").get<string>()),
              "# FILE: main.py\nimport util\n\n# FILE: util.py\nprint(7)\n\n");
    EXPECT_EQ(base64_decode(payload.at("stdin").get<string>()), "");
    EXPECT_TRUE(fs::is_empty(root));
}

TEST_F(DispatcherTest, JavaWithoutJarsGoesRemoteTest) {
    EXPECT_CALL(transport, post(_, _, _, _))
        .WillOnce(Return(remote::mock::judge0_response("", "", "Main.java:1: error")));

    auto result = dispatch->dispatch(java_submission());
    EXPECT_EQ(result.error, optional<string>("Main.java:1: error"));
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(fs::exists(fake.run_marker()));
}

TEST_F(DispatcherTest, JavaWithJarsGoesLocalTest) {
    EXPECT_CALL(transport, post(_, _, _, _)).Times(0);

    auto submit = java_submission();
    submit.jars = {{"dep.jar", base64_encode("PK\x03\x04")}};
    auto result = dispatch->dispatch(submit);

    EXPECT_EQ(result.output, "ran Main\n");
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(fs::exists(fake.run_marker()));
    EXPECT_TRUE(fs::is_empty(root));
}

TEST_F(DispatcherTest, ProtocolErrorPropagatesTest) {
    remote::http_response response;
    response.status = 503;
    response.body = "Service Unavailable";
    EXPECT_CALL(transport, post(_, _, _, _)).WillOnce(Return(response));

    auto submit = java_submission();
    submit.language = "c";
    EXPECT_THROW(dispatch->dispatch(submit), protocol_error);
}

TEST_F(DispatcherTest, LocalInfrastructureFailureTest) {
    // 工作目录的根目录不存在时无法创建临时目录
    sandbox::local_sandbox broken(root / "missing", fake.tools());
    dispatcher broken_dispatch(languages, broken, *client);

    auto submit = java_submission();
    submit.jars = {{"dep.jar", base64_encode("PK")}};
    auto result = broken_dispatch.dispatch(submit);
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error);
    EXPECT_EQ(result.error->rfind("Execution failed: ", 0), 0u);
}
