#include "common/io_utils.hpp"
#include <glog/logging.h>
#include <unistd.h>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fstream>
#include <system_error>
#include <vector>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace runner {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open " + path.string());
    fout.write(content.data(), content.size());
    fout.close();
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

string assert_safe_path(const string &name) {
    if (name.empty() || name == "." || name == ".." ||
        name.find('/') != string::npos ||
        name.find('\\') != string::npos ||
        name.find('\0') != string::npos)
        throw invalid_submission("unsafe file name: " + name);
    return name;
}

fs::path create_unique_directory(const fs::path &root, const string &prefix) {
    // boost::uuids::random_generator 不是线程安全的，每次调用都构造一个新的
    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    fs::path dir = root / (prefix + uuid);
    error_code ec;
    if (!fs::create_directory(dir, ec)) {
        if (!ec) ec = make_error_code(errc::file_exists);
        throw fs::filesystem_error("unable to create directory", dir, ec);
    }
    return dir;
}

bool remove_directory_quietly(const fs::path &dir) noexcept {
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        LOG(WARNING) << "Unable to remove " << dir << ": " << ec.message();
        return false;
    }
    return true;
}

fs::path find_executable(const string &name) {
    if (name.find('/') != string::npos)
        return access(name.c_str(), X_OK) == 0 ? fs::path(name) : fs::path();

    vector<string> dirs;
    string path_env = get_env("PATH", "");
    boost::split(dirs, path_env, boost::is_any_of(":"));
    for (auto &dir : dirs) {
        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / name;
        error_code ec;
        if (access(candidate.c_str(), X_OK) == 0 && fs::is_regular_file(candidate, ec))
            return candidate;
    }
    return {};
}

}  // namespace runner
