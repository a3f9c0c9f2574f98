#include "runner/dispatcher.hpp"
#include <glog/logging.h>
#include <filesystem>
#include <system_error>
#include "runner/assembler.hpp"
#include "runner/normalizer.hpp"

namespace runner {
using namespace std;

dispatcher::dispatcher(const language_table &languages, const sandbox::local_sandbox &local, const remote::judge_client &client)
    : languages(languages), route(languages), local(local), client(client) {}

execution_result dispatcher::dispatch(const submission &submit) const {
    backend_type backend = route.route(submit.language, submit.has_jars());
    const language_descriptor &lang = languages.at(submit.language);
    LOG(INFO) << "Dispatching " << lang.id << " submission with entrypoint " << submit.entrypoint
              << " to " << backend_name(backend) << " backend";

    if (backend == backend_type::LOCAL_SANDBOX)
        return run_locally(submit, lang);
    else
        return run_remotely(submit, lang);
}

execution_result dispatcher::run_locally(const submission &submit, const language_descriptor &lang) const {
    try {
        return normalize(local.execute(submit, lang));
    } catch (filesystem::filesystem_error &e) {
        LOG(ERROR) << "Local sandbox failed: " << e.what();
        return execution_result::failed(e.what());
    } catch (system_error &e) {
        LOG(ERROR) << "Local sandbox failed: " << e.what();
        return execution_result::failed(e.what());
    }
}

execution_result dispatcher::run_remotely(const submission &submit, const language_descriptor &lang) const {
    string source = assemble_source(submit.files, submit.jars, lang.comment_token, !client.supports_attachments());
    auto raw = client.submit(lang.backend_id, source, submit.stdin_text.value_or(""), chrono::seconds(submit.timeout_seconds));
    return normalize(raw, client.encoding());
}

}  // namespace runner
