#include <curl/curl.h>
#include <glog/logging.h>
#include <signal.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <iterator>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "remote/http_transport.hpp"
#include "remote/judge_client.hpp"
#include "runner/dispatcher.hpp"
#include "runner/language.hpp"
#include "runner/submission.hpp"
#include "sandbox/local_sandbox.hpp"
using namespace std;
using namespace nlohmann;

static json error_document(long status_code, const string &detail) {
    return {{"status_code", status_code}, {"detail", detail}};
}

static string read_request(const string &source) {
    if (source == "-") {
        return string((istreambuf_iterator<char>(cin)), istreambuf_iterator<char>());
    } else {
        if (!filesystem::is_regular_file(source))
            throw runner::invalid_submission("request file " + source + " does not exist");
        return runner::read_file_content(source);
    }
}

/**
 * @brief 处理一个请求文件，返回要输出的 JSON 文档
 * 所有异常都会被转换为错误文档，保证每个请求都有且只有一个输出
 */
static json handle_request(const runner::dispatcher &dispatcher, const string &source, const string &content) {
    try {
        ordered_json request;
        try {
            request = ordered_json::parse(content);
        } catch (json::parse_error &e) {
            throw runner::invalid_submission(string("request is not valid JSON: ") + e.what());
        }

        runner::submission submit = runner::parse_submission(request, runner::DEFAULT_TIMEOUT);
        runner::execution_result result = dispatcher.dispatch(submit);
        LOG(INFO) << "Request " << source << " finished, success: " << result.success;
        return runner::to_json(result, runner::INCLUDE_RAW);
    } catch (runner::unsupported_language_error &e) {
        LOG(WARNING) << "Request " << source << " rejected, unsupported language " << e.language;
        return error_document(400, e.what());
    } catch (runner::rejection_error &e) {
        LOG(WARNING) << "Request " << source << " rejected: " << e.what();
        return error_document(400, e.what());
    } catch (runner::protocol_error &e) {
        return error_document(e.status_code(), e.body());
    } catch (runner::runner_exception &e) {
        LOG(ERROR) << "Request " << source << " failed: " << e;
        return error_document(500, e.what());
    } catch (std::exception &e) {
        LOG(ERROR) << "Request " << source << " failed: " << boost::diagnostic_information(e);
        return error_document(500, e.what());
    }
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    // 子进程提前退出时写 stdin 会触发 SIGPIPE，我们通过 EPIPE 处理
    signal(SIGPIPE, SIG_IGN);

    CHECK(curl_global_init(CURL_GLOBAL_ALL) == CURLE_OK)
        << "Unable to initialize libcurl";
    defer {
        curl_global_cleanup();
    };

    namespace po = boost::program_options;
    po::options_description desc("coderunner options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("request", po::value<vector<string>>(), "request documents to execute, \"-\" for standard input. Reads standard input if omitted")
        ("endpoint", po::value<string>(), "set the Judge0 submission endpoint. base64_encoded=true in the query selects base64 encoding. You can either pass it from environ JUDGE0_URL")
        ("workspace-dir", po::value<string>(), "set the directory where temporary workspaces of local runs are created, default to the system temporary directory. You can either pass it from environ WORKSPACEDIR")
        ("javac", po::value<string>(), "set the compiler used for local runs, default to javac. You can either pass it from environ JAVAC")
        ("java", po::value<string>(), "set the runtime used for local runs, default to java. You can either pass it from environ JAVA")
        ("timeout", po::value<int>(), "set the timeout in seconds for requests without timeout_seconds, default to 10. You can either pass it from environ TIMEOUT")
        ("languages", po::value<string>(), "load the language table from the given JSON file instead of the built-in one")
        ("include-raw", "attach the unprocessed backend response to every result")
        ("list-languages", "print the supported languages and exit")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("request", -1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "coderunner: Execute multi-file code submissions on a remote Judge0 service or a local Java toolchain" << endl
             << "Optional Environment Variables:" << endl
             << "\tJUDGE0_URL: Judge0 submission endpoint" << endl
             << "\tWORKSPACEDIR: parent directory of local workspaces" << endl
             << "\tJAVAC, JAVA: local compiler and runtime" << endl
             << "\tTIMEOUT: timeout in seconds for requests without timeout_seconds" << endl
             << "Usage: " << argv[0] << " [options] [request.json ...]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "coderunner 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("languages")) {
        runner::LANGUAGES_FILE = filesystem::path(vm.at("languages").as<string>());
        CHECK(filesystem::is_regular_file(runner::LANGUAGES_FILE))
            << "Language table " << runner::LANGUAGES_FILE << " does not exist";
    }

    unique_ptr<runner::language_table> languages;
    try {
        if (runner::LANGUAGES_FILE.empty())
            languages = make_unique<runner::language_table>(runner::language_table::defaults());
        else
            languages = make_unique<runner::language_table>(runner::language_table::load(runner::LANGUAGES_FILE));
    } catch (std::exception &e) {
        LOG(FATAL) << "Language table " << runner::LANGUAGES_FILE << " is malformed: " << e.what();
    }

    if (vm.count("list-languages")) {
        json j = {{"languages", languages->identifiers()}};
        cout << j.dump() << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("endpoint")) {
        runner::JUDGE_ENDPOINT = vm.at("endpoint").as<string>();
    } else if (getenv("JUDGE0_URL")) {
        runner::JUDGE_ENDPOINT = getenv("JUDGE0_URL");
    }

    if (vm.count("workspace-dir")) {
        runner::WORKSPACE_DIR = filesystem::path(vm.at("workspace-dir").as<string>());
    } else if (getenv("WORKSPACEDIR")) {
        runner::WORKSPACE_DIR = filesystem::path(getenv("WORKSPACEDIR"));
    } else {
        runner::WORKSPACE_DIR = filesystem::temp_directory_path();
    }
    CHECK(filesystem::is_directory(runner::WORKSPACE_DIR))
        << "Workspace directory " << runner::WORKSPACE_DIR << " does not exist";

    if (vm.count("javac")) {
        runner::JAVAC_PATH = vm.at("javac").as<string>();
    } else if (getenv("JAVAC")) {
        runner::JAVAC_PATH = getenv("JAVAC");
    }

    if (vm.count("java")) {
        runner::JAVA_PATH = vm.at("java").as<string>();
    } else if (getenv("JAVA")) {
        runner::JAVA_PATH = getenv("JAVA");
    }

    if (vm.count("timeout")) {
        runner::DEFAULT_TIMEOUT = vm.at("timeout").as<int>();
    } else if (getenv("TIMEOUT")) {
        try {
            runner::DEFAULT_TIMEOUT = runner::parse_timeout_setting(getenv("TIMEOUT"));
        } catch (invalid_argument &e) {
            LOG(FATAL) << "Environment variable TIMEOUT is malformed: " << e.what();
        }
    }
    CHECK(runner::DEFAULT_TIMEOUT > 0)
        << "Timeout should be a positive number of seconds";

    runner::INCLUDE_RAW = vm.count("include-raw") > 0;

    if (runner::find_executable(runner::JAVAC_PATH).empty())
        LOG(WARNING) << "Compiler " << runner::JAVAC_PATH << " not found, local runs will fail";

    runner::sandbox::toolchain tools;
    tools.compiler = runner::JAVAC_PATH;
    tools.runtime = runner::JAVA_PATH;
    runner::sandbox::local_sandbox sandbox(runner::WORKSPACE_DIR, tools);
    LOG(INFO) << "Local workspaces are created under " << sandbox.workspace_root();

    runner::remote::curl_transport transport;
    runner::remote::judge_client client(runner::JUDGE_ENDPOINT, transport);
    LOG(INFO) << "Remote submissions are posted to " << client.endpoint();

    runner::dispatcher dispatcher(*languages, sandbox, client);

    vector<string> sources = {"-"};
    if (vm.count("request"))
        sources = vm.at("request").as<vector<string>>();

    // 先在主线程读取所有请求，标准输入只能读一次
    vector<string> contents(sources.size());
    vector<json> responses(sources.size());
    vector<bool> readable(sources.size(), false);
    for (size_t i = 0; i < sources.size(); ++i) {
        try {
            contents[i] = read_request(sources[i]);
            readable[i] = true;
        } catch (runner::rejection_error &e) {
            responses[i] = error_document(400, e.what());
        }
    }

    vector<thread> request_threads;
    for (size_t i = 0; i < sources.size(); ++i) {
        if (!readable[i]) continue;
        request_threads.emplace_back([&, i] {
            responses[i] = handle_request(dispatcher, sources[i], contents[i]);
        });
    }

    for (auto &th : request_threads)
        th.join();

    for (auto &response : responses)
        cout << response.dump(-1, ' ', false, json::error_handler_t::replace) << endl;

    return EXIT_SUCCESS;
}
