#include "test/fake_toolchain.hpp"
#include "common/io_utils.hpp"

namespace runner::test {
using namespace std;
namespace fs = std::filesystem;

static const char *FAKE_COMPILER = R"(#!/bin/sh
# 参数：-encoding UTF-8 [-cp <deps>] -d <dir> <sources...>
out=""
while [ $# -gt 0 ]; do
    case "$1" in
        -encoding|-cp) shift 2 ;;
        -d) out="$2"; shift 2 ;;
        *) break ;;
    esac
done
if grep -l "SYNTAX ERROR" "$@" >/dev/null 2>&1; then
    echo "$1:1: error: ';' expected" >&2
    exit 1
fi
for src in "$@"; do
    : > "$out/$(basename "$src" .java).class"
done
)";

static const char *FAKE_RUNTIME = R"(#!/bin/sh
printf '%s\n' "$@" > "$(dirname "$0")/run.args"
unit=""
for arg in "$@"; do unit="$arg"; done
case "$unit" in
    Echo) cat ;;
    Sleeper) sleep 30 ;;
    Fail) echo "boom" >&2; exit 3 ;;
    *) echo "ran $unit" ;;
esac
)";

fake_toolchain::fake_toolchain()
    : dir(create_unique_directory(fs::temp_directory_path(), "toolchain-")) {
    write_file_content(dir / "javac", FAKE_COMPILER);
    write_file_content(dir / "java", FAKE_RUNTIME);
    for (auto name : {"javac", "java"})
        fs::permissions(dir / name, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);
}

fake_toolchain::~fake_toolchain() {
    remove_directory_quietly(dir);
}

sandbox::toolchain fake_toolchain::tools() const {
    sandbox::toolchain tools;
    tools.compiler = (dir / "javac").string();
    tools.runtime = (dir / "java").string();
    return tools;
}

fs::path fake_toolchain::run_marker() const {
    return dir / "run.args";
}

}  // namespace runner::test
