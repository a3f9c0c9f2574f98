#include "sandbox/local_sandbox.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <set>
#include <stdexcept>
#include "common/base64.hpp"
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace runner::sandbox {
using namespace std;
namespace fs = std::filesystem;

string runnable_unit_name(const string &entrypoint, const string &extension) {
    if (!extension.empty() && entrypoint.size() > extension.size() && boost::algorithm::ends_with(entrypoint, extension))
        return entrypoint.substr(0, entrypoint.size() - extension.size());
    return entrypoint;
}

local_sandbox::local_sandbox(const fs::path &workspace_root, toolchain tools)
    : root(workspace_root), tools(move(tools)) {}

const fs::path &local_sandbox::workspace_root() const {
    return root;
}

local_run_result local_sandbox::execute(const submission &submit, const language_descriptor &lang) const {
    // 在写入任何文件之前完成所有检查
    vector<string> sources;
    set<string> names;
    for (auto &[filename, content] : submit.files) {
        assert_safe_path(filename);
        names.insert(filename);
        if (boost::algorithm::ends_with(filename, lang.source_extension))
            sources.push_back(filename);
    }
    if (sources.empty())
        throw invalid_submission("no " + lang.source_extension + " source file to compile");

    file_list dependencies;
    for (auto &[name, encoded] : submit.jars) {
        assert_safe_path(name);
        if (!names.insert(name).second)
            throw invalid_submission("jar " + name + " conflicts with another file of the same name");
        try {
            dependencies.emplace_back(name, base64_decode(encoded));
        } catch (invalid_argument &e) {
            throw invalid_submission("jar " + name + " is not valid base64: " + e.what());
        }
    }

    string unit = runnable_unit_name(assert_safe_path(submit.entrypoint), lang.source_extension);

    fs::path workdir = create_unique_directory(root, "run-");
    defer {
        if (remove_directory_quietly(workdir))
            LOG(INFO) << "Removed workspace " << workdir;
    };
    LOG(INFO) << "Created workspace " << workdir << " for " << submit.files.size() << " files and " << dependencies.size() << " dependencies";

    for (auto &[filename, content] : submit.files)
        write_file_content(workdir / filename, content);

    vector<string> dependency_paths;
    for (auto &[name, bytes] : dependencies) {
        write_file_content(workdir / name, bytes);
        dependency_paths.push_back((workdir / name).string());
    }

    process_options options;
    options.workdir = workdir;
    options.timeout = chrono::seconds(submit.timeout_seconds);

    local_run_result result;
    result.phase = local_run_result::phase_type::COMPILE;

    vector<string> compile_args = {"-encoding", "UTF-8"};
    if (!dependency_paths.empty()) {
        compile_args.push_back("-cp");
        compile_args.push_back(boost::algorithm::join(dependency_paths, tools.path_separator));
    }
    compile_args.push_back("-d");
    compile_args.push_back(workdir.string());

    elapsed_time compile_time;
    result.process = call_process(options, tools.compiler, compile_args, sources);
    LOG(INFO) << "Compilation finished in " << compile_time.duration<chrono::milliseconds>().count() << "ms"
              << (result.process.timed_out ? " (timed out)" : "");
    if (!result.process.exited_normally())
        return result;

    vector<string> search_path = dependency_paths;
    search_path.push_back(workdir.string());

    options.input = submit.stdin_text.value_or("");
    result.phase = local_run_result::phase_type::RUN;

    elapsed_time run_time;
    result.process = call_process(options, tools.runtime, "-cp", boost::algorithm::join(search_path, tools.path_separator), unit);
    LOG(INFO) << "Run of " << unit << " finished in " << run_time.duration<chrono::milliseconds>().count() << "ms"
              << " with exit code " << result.process.exit_code
              << (result.process.timed_out ? " (timed out)" : "");
    return result;
}

}  // namespace runner::sandbox
