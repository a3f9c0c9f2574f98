#include "config.hpp"
#include <boost/lexical_cast.hpp>
#include <stdexcept>

namespace runner {
using namespace std;

const char *DEFAULT_JUDGE_ENDPOINT = "https://ce.judge0.com/submissions/?base64_encoded=true&wait=true";

string JUDGE_ENDPOINT = DEFAULT_JUDGE_ENDPOINT;
filesystem::path WORKSPACE_DIR;
string JAVAC_PATH = "javac";
string JAVA_PATH = "java";
int DEFAULT_TIMEOUT = 10;
filesystem::path LANGUAGES_FILE;
bool INCLUDE_RAW = false;

int parse_timeout_setting(const string &text) {
    int seconds = 0;
    if (!boost::conversion::try_lexical_convert(text, seconds) || seconds <= 0)
        throw invalid_argument("timeout should be a positive number of seconds, got \"" + text + "\"");
    return seconds;
}

}  // namespace runner
