#include "runner/result.hpp"

namespace runner {
using namespace std;
using namespace nlohmann;

const char *EXECUTION_TIMED_OUT = "Execution timed out.";

execution_result execution_result::timed_out() {
    execution_result result;
    result.error = EXECUTION_TIMED_OUT;
    result.success = false;
    return result;
}

execution_result execution_result::failed(const string &detail) {
    execution_result result;
    result.error = "Execution failed: " + detail;
    result.success = false;
    return result;
}

json to_json(const execution_result &result, bool include_raw) {
    json j = {{"output", result.output},
              {"error", nullptr},
              {"success", result.success}};
    if (result.error) j["error"] = *result.error;
    if (include_raw) j["raw"] = result.raw;
    return j;
}

}  // namespace runner
