#include "runner/router.hpp"

namespace runner {
using namespace std;

const char *backend_name(backend_type backend) {
    switch (backend) {
        case backend_type::LOCAL_SANDBOX:
            return "local";
        case backend_type::REMOTE_JUDGE:
            return "remote";
    }
    return "unknown";
}

router::router(const language_table &languages)
    : languages(languages) {}

backend_type router::route(const string &language, bool has_dependencies) const {
    const language_descriptor &lang = languages.at(language);
    if (lang.requires_local_sandbox && has_dependencies)
        return backend_type::LOCAL_SANDBOX;
    return backend_type::REMOTE_JUDGE;
}

}  // namespace runner
