#include "runner/language.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <stdexcept>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace runner {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, language_descriptor &lang) {
    lang.id = boost::algorithm::to_lower_copy(get_value<string>(j, "id", "a string"));
    lang.backend_id = get_value<int>(j, "backend_id", "an integer");
    lang.comment_token = get_value<string>(j, "comment_token", "a string");
    lang.requires_local_sandbox = get_value_def<bool>(j, false, "requires_local_sandbox", "a boolean");
    lang.source_extension = get_value_def<string>(j, "", "source_extension", "a string");
}

void to_json(json &j, const language_descriptor &lang) {
    j = {{"id", lang.id},
         {"backend_id", lang.backend_id},
         {"comment_token", lang.comment_token},
         {"requires_local_sandbox", lang.requires_local_sandbox},
         {"source_extension", lang.source_extension}};
}

language_table::language_table(vector<language_descriptor> languages)
    : entries(move(languages)) {
    for (size_t i = 0; i < entries.size(); ++i) {
        auto &lang = entries[i];
        lang.id = boost::algorithm::to_lower_copy(lang.id);
        if (lang.id.empty())
            throw invalid_argument("language id must not be empty");
        if (lang.comment_token.empty())
            throw invalid_argument("comment token of " + lang.id + " must not be empty");
        if (!index.emplace(lang.id, i).second)
            throw invalid_argument("duplicate language " + lang.id);
    }
}

const language_descriptor *language_table::find(const string &language) const {
    auto it = index.find(boost::algorithm::to_lower_copy(language));
    return it == index.end() ? nullptr : &entries[it->second];
}

const language_descriptor &language_table::at(const string &language) const {
    if (auto lang = find(language)) return *lang;
    throw unsupported_language_error(language);
}

vector<string> language_table::identifiers() const {
    vector<string> ids;
    for (auto &lang : entries) ids.push_back(lang.id);
    return ids;
}

language_table language_table::defaults() {
    // clang-format off
    return language_table({
        {"c",          50, "//", false, ".c"},
        {"cpp",        54, "//", false, ".cpp"},
        {"java",       62, "//", true,  ".java"},
        {"python",     71, "#",  false, ".py"},
        {"javascript", 63, "//", false, ".js"},
        {"ruby",       72, "#",  false, ".rb"},
        {"go",         60, "//", false, ".go"},
        {"bash",       46, "#",  false, ".sh"},
    });
    // clang-format on
}

language_table language_table::load(const filesystem::path &path) {
    json j;
    try {
        j = json::parse(read_file_content(path));
    } catch (json::parse_error &e) {
        throw invalid_argument("language table " + path.string() + " is not valid JSON: " + e.what());
    }
    if (!j.is_object() || !exists(j, "languages") || !j.at("languages").is_array())
        throw invalid_argument("language table " + path.string() + " must contain a \"languages\" array");

    vector<language_descriptor> languages;
    for (auto &item : j.at("languages"))
        languages.push_back(item.get<language_descriptor>());
    LOG(INFO) << "Loaded " << languages.size() << " languages from " << path;
    return language_table(move(languages));
}

}  // namespace runner
