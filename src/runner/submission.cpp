#include "runner/submission.hpp"
#include <cstdint>
#include <limits>
#include <set>
#include <stdexcept>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace runner {
using namespace std;
using namespace nlohmann;

bool submission::has_jars() const {
    return !jars.empty();
}

static file_list parse_file_list(const ordered_json &j, const string &key) {
    const ordered_json &obj = j.at(key);
    if (!obj.is_object())
        throw invalid_submission("field '" + key + "' must be an object of strings");

    file_list result;
    set<string> names;
    for (auto &[name, content] : obj.items()) {
        if (!content.is_string())
            throw invalid_submission("content of '" + name + "' in '" + key + "' must be a string");
        if (!names.insert(name).second)
            throw invalid_submission("duplicate file name '" + name + "' in '" + key + "'");
        result.emplace_back(name, content.get<string>());
    }
    return result;
}

// get<int> 会把 true、1.9 和超出 int 范围的整数悄悄转换，因此这里先检查原始类型和范围
static int parse_timeout(const ordered_json &j, int default_timeout) {
    if (!exists(j, "timeout_seconds")) return default_timeout;
    const ordered_json &value = j.at("timeout_seconds");
    if (value.is_number_unsigned()) {
        if (value.get<uint64_t>() > (uint64_t)numeric_limits<int>::max())
            throw invalid_submission("field 'timeout_seconds' is too large");
        return (int)value.get<uint64_t>();
    }
    if (value.is_number_integer())
        throw invalid_submission("field 'timeout_seconds' must be a positive integer");
    throw invalid_submission("field 'timeout_seconds' must be an integer");
}

submission parse_submission(const ordered_json &j, int default_timeout) {
    if (!j.is_object())
        throw invalid_submission("request must be a JSON object");

    submission submit;
    try {
        submit.language = get_value<string>(j, "language", "a string");
        submit.entrypoint = get_value<string>(j, "entrypoint", "a string");
        if (exists(j, "stdin"))
            submit.stdin_text = get_value<string>(j, "stdin", "a string");
        submit.timeout_seconds = parse_timeout(j, default_timeout);
    } catch (invalid_argument &e) {
        throw invalid_submission(e.what());
    }

    if (submit.entrypoint.empty())
        throw invalid_submission("field 'entrypoint' must not be empty");

    if (!exists(j, "files"))
        throw invalid_submission("field 'files' must be an object of strings");
    submit.files = parse_file_list(j, "files");
    if (submit.files.empty())
        throw invalid_submission("field 'files' must not be empty");

    if (exists(j, "jars"))
        submit.jars = parse_file_list(j, "jars");

    if (submit.timeout_seconds <= 0)
        throw invalid_submission("field 'timeout_seconds' must be a positive integer");

    return submit;
}

}  // namespace runner
