#include "runner/normalizer.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <stdexcept>
#include "common/base64.hpp"

namespace runner {
using namespace std;
using namespace nlohmann;

static string judge_field(const json &body, const string &field, remote::transport_encoding encoding) {
    if (!body.count(field) || !body.at(field).is_string()) return "";
    const string &value = body.at(field).get_ref<const string &>();
    if (value.empty() || encoding == remote::transport_encoding::PLAIN) return value;

    try {
        return base64_decode(value);
    } catch (invalid_argument &e) {
        LOG(WARNING) << "Unable to decode field " << field << " of judge response: " << e.what();
        return fmt::format("<failed to decode {}>", field);
    }
}

execution_result normalize(const raw_judge_result &raw, remote::transport_encoding encoding) {
    switch (raw.state) {
        case raw_judge_result::state_type::TIMED_OUT: {
            auto result = execution_result::timed_out();
            result.raw = {{"state", "timed_out"}, {"detail", raw.detail}};
            return result;
        }
        case raw_judge_result::state_type::FAILED: {
            auto result = execution_result::failed(raw.detail);
            result.raw = {{"state", "failed"}, {"detail", raw.detail}};
            return result;
        }
        case raw_judge_result::state_type::COMPLETED:
            break;
    }

    execution_result result;
    result.output = judge_field(raw.body, "stdout", encoding);
    string stderr_text = judge_field(raw.body, "stderr", encoding);
    string compile_output = judge_field(raw.body, "compile_output", encoding);

    if (!stderr_text.empty())
        result.error = stderr_text;
    else if (!compile_output.empty())
        result.error = compile_output;

    result.success = !result.error;
    result.raw = raw.body;
    return result;
}

static string describe_termination(const process_result &process) {
    if (process.signal)
        return fmt::format("killed by signal {}", process.signal);
    return fmt::format("exit code {}", process.exit_code);
}

execution_result normalize(const local_run_result &raw) {
    const process_result &process = raw.process;
    bool compiling = raw.phase == local_run_result::phase_type::COMPILE;

    execution_result result;
    result.raw = {{"phase", compiling ? "compile" : "run"},
                  {"exit_code", process.exit_code},
                  {"signal", process.signal},
                  {"timed_out", process.timed_out},
                  {"stdout", process.out},
                  {"stderr", process.err}};

    if (process.timed_out) {
        result.error = EXECUTION_TIMED_OUT;
        result.success = false;
        return result;
    }

    if (compiling && !process.exited_normally()) {
        // javac 把诊断信息写到 stderr，其他编译器可能写到 stdout
        if (!process.err.empty())
            result.error = process.err;
        else if (!process.out.empty())
            result.error = process.out;
        else
            result.error = "Compilation failed with " + describe_termination(process);
        result.success = false;
        return result;
    }

    result.output = process.out;
    if (!process.err.empty()) result.error = process.err;
    result.success = process.exited_normally();
    return result;
}

}  // namespace runner
