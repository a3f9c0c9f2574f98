#include "common/base64.hpp"
#include "common/exceptions.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "remote/judge_client.hpp"
#include "runner/normalizer.hpp"
#include "test/mock_transport.hpp"

using namespace std;
using namespace runner;
using namespace runner::remote;
using namespace testing;
using nlohmann::json;

static const string BASE64_ENDPOINT = "https://judge.example.com/submissions/?base64_encoded=true&wait=true";
static const string PLAIN_ENDPOINT = "https://judge.example.com/submissions/?wait=true";

static const string SUM_PROGRAM = "a = int(input())\nb = int(input())\nprint(a + b)\n";

TEST(JudgeClientTest, EncodingOfEndpointTest) {
    EXPECT_EQ(encoding_of_endpoint(BASE64_ENDPOINT), transport_encoding::BASE64);
    EXPECT_EQ(encoding_of_endpoint("https://judge.example.com/submissions?wait=true&base64_encoded=TRUE"), transport_encoding::BASE64);
    EXPECT_EQ(encoding_of_endpoint(PLAIN_ENDPOINT), transport_encoding::PLAIN);
    EXPECT_EQ(encoding_of_endpoint("https://judge.example.com/submissions/?base64_encoded=false"), transport_encoding::PLAIN);
    EXPECT_EQ(encoding_of_endpoint("https://judge.example.com/submissions/"), transport_encoding::PLAIN);
    EXPECT_EQ(encoding_of_endpoint("https://judge.example.com/submissions/#base64_encoded=true"), transport_encoding::PLAIN);
    EXPECT_EQ(encoding_of_endpoint("https://judge.example.com/submissions/?x_base64_encoded=true"), transport_encoding::PLAIN);
}

TEST(JudgeClientTest, Base64RequestTest) {
    mock::mock_transport transport;
    judge_client client(BASE64_ENDPOINT, transport);

    string body;
    EXPECT_CALL(transport, post(BASE64_ENDPOINT, "application/json", _, chrono::seconds(5)))
        .WillOnce(DoAll(SaveArg<2>(&body), Return(mock::judge0_response("7\n"))));

    auto raw = client.submit(71, SUM_PROGRAM, "3\n4\n", chrono::seconds(5));
    EXPECT_EQ(raw.state, raw_judge_result::state_type::COMPLETED);

    json payload = json::parse(body);
    EXPECT_EQ(payload.at("language_id").get<int>(), 71);
    EXPECT_EQ(payload.at("source_code").get<string>(), base64_encode(SUM_PROGRAM));
    EXPECT_EQ(payload.at("stdin").get<string>(), base64_encode("3\n4\n"));
}

TEST(JudgeClientTest, SumProgramTest) {
    mock::mock_transport transport;
    judge_client client(BASE64_ENDPOINT, transport);
    EXPECT_CALL(transport, post(_, _, _, _))
        .WillOnce(Return(mock::judge0_response("7\n")));

    auto result = normalize(client.submit(71, SUM_PROGRAM, "3\n4\n", chrono::seconds(10)), client.encoding());
    EXPECT_NE(result.output.find("7"), string::npos);
    EXPECT_FALSE(result.error);
    EXPECT_TRUE(result.success);
}

TEST(JudgeClientTest, PlainRequestTest) {
    mock::mock_transport transport;
    judge_client client(PLAIN_ENDPOINT, transport);
    EXPECT_EQ(client.encoding(), transport_encoding::PLAIN);
    EXPECT_EQ(client.endpoint(), PLAIN_ENDPOINT);

    string body;
    http_response response;
    response.status = 200;
    response.body = R"({"stdout": "7\n", "stderr": null, "compile_output": null})";
    EXPECT_CALL(transport, post(PLAIN_ENDPOINT, _, _, _))
        .WillOnce(DoAll(SaveArg<2>(&body), Return(response)));

    auto raw = client.submit(71, SUM_PROGRAM, "3\n4\n", chrono::seconds(5));
    json payload = json::parse(body);
    EXPECT_EQ(payload.at("source_code").get<string>(), SUM_PROGRAM);
    EXPECT_EQ(payload.at("stdin").get<string>(), "3\n4\n");

    auto result = normalize(raw, client.encoding());
    EXPECT_EQ(result.output, "7\n");
    EXPECT_TRUE(result.success);
}

TEST(JudgeClientTest, ProtocolErrorTest) {
    mock::mock_transport transport;
    judge_client client(BASE64_ENDPOINT, transport);
    http_response response;
    response.status = 422;
    response.body = R"({"language_id": ["language with id 9999 doesn't exist"]})";
    EXPECT_CALL(transport, post(_, _, _, _)).WillOnce(Return(response));

    try {
        client.submit(9999, "", "", chrono::seconds(10));
        FAIL() << "non-2xx response should be propagated";
    } catch (protocol_error &e) {
        EXPECT_EQ(e.status_code(), 422);
        EXPECT_EQ(e.body(), response.body);
    }
}

TEST(JudgeClientTest, TimeoutTest) {
    mock::mock_transport transport;
    judge_client client(BASE64_ENDPOINT, transport);
    EXPECT_CALL(transport, post(_, _, _, chrono::seconds(1)))
        .WillOnce(Throw(timeout_error("Operation timed out after 1000 milliseconds")));

    auto raw = client.submit(71, "import time\ntime.sleep(5)\n", "", chrono::seconds(1));
    EXPECT_EQ(raw.state, raw_judge_result::state_type::TIMED_OUT);

    auto result = normalize(raw, client.encoding());
    EXPECT_EQ(result.output, "");
    EXPECT_EQ(result.error, optional<string>("Execution timed out."));
    EXPECT_FALSE(result.success);
}

TEST(JudgeClientTest, NetworkFailureTest) {
    mock::mock_transport transport;
    judge_client client(BASE64_ENDPOINT, transport);
    EXPECT_CALL(transport, post(_, _, _, _))
        .WillOnce(Throw(network_error("Could not resolve host: judge.example.com")));

    auto result = normalize(client.submit(71, "print(1)", "", chrono::seconds(10)), client.encoding());
    EXPECT_EQ(result.output, "");
    EXPECT_EQ(result.error, optional<string>("Execution failed: Could not resolve host: judge.example.com"));
    EXPECT_FALSE(result.success);
}

TEST(JudgeClientTest, MalformedResponseTest) {
    mock::mock_transport transport;
    judge_client client(BASE64_ENDPOINT, transport);
    http_response html, array;
    html.status = 200;
    html.body = "<html>Bad Gateway</html>";
    array.status = 200;
    array.body = "[1, 2]";
    EXPECT_CALL(transport, post(_, _, _, _))
        .WillOnce(Return(html))
        .WillOnce(Return(array));

    auto first = client.submit(71, "print(1)", "", chrono::seconds(10));
    EXPECT_EQ(first.state, raw_judge_result::state_type::FAILED);
    EXPECT_NE(first.detail.find("malformed judge response"), string::npos);

    auto second = normalize(client.submit(71, "print(1)", "", chrono::seconds(10)), client.encoding());
    EXPECT_FALSE(second.success);
    ASSERT_TRUE(second.error);
    EXPECT_EQ(second.error->rfind("Execution failed: ", 0), 0u);
}

TEST(JudgeClientTest, InvalidUtf8SourceTest) {
    mock::mock_transport transport;
    judge_client client(PLAIN_ENDPOINT, transport);
    EXPECT_CALL(transport, post(_, _, _, _))
        .WillOnce(Return(mock::judge0_response("")));
    EXPECT_NO_THROW(client.submit(71, "print('\xff')", "", chrono::seconds(10)));
}
