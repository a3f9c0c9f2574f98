#include "runner/assembler.hpp"
#include <fmt/core.h>

namespace runner {
using namespace std;

string assemble_source(const file_list &files, const file_list &jars, const string &comment_token, bool attach_jars) {
    string source;
    for (auto &[filename, content] : files)
        source += fmt::format("{} FILE: {}\n{}\n\n", comment_token, filename, content);

    if (attach_jars)
        for (auto &[name, content] : jars)
            source += fmt::format("{} JAR:{}:{}\n", comment_token, name, content);

    return source;
}

}  // namespace runner
