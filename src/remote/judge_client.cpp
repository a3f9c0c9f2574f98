#include "remote/judge_client.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <vector>
#include "common/base64.hpp"
#include "common/exceptions.hpp"

namespace runner::remote {
using namespace std;
using namespace nlohmann;

transport_encoding encoding_of_endpoint(const string &url) {
    auto query_begin = url.find('?');
    if (query_begin == string::npos) return transport_encoding::PLAIN;
    string query = url.substr(query_begin + 1);
    query = query.substr(0, query.find('#'));

    vector<string> params;
    boost::split(params, query, boost::is_any_of("&"));
    transport_encoding result = transport_encoding::PLAIN;
    for (auto &param : params) {
        auto eq = param.find('=');
        if (eq == string::npos || param.substr(0, eq) != "base64_encoded") continue;
        result = boost::algorithm::to_lower_copy(param.substr(eq + 1)) == "true"
                     ? transport_encoding::BASE64
                     : transport_encoding::PLAIN;
    }
    return result;
}

judge_client::judge_client(const string &endpoint, http_transport &transport)
    : url(endpoint), mode(encoding_of_endpoint(endpoint)), transport(transport) {
    LOG(INFO) << "Remote judge " << url << " uses " << (mode == transport_encoding::BASE64 ? "base64" : "plain") << " encoding";
}

string judge_client::encode(const string &text) const {
    return mode == transport_encoding::BASE64 ? base64_encode(text) : text;
}

raw_judge_result judge_client::submit(int backend_id, const string &source, const string &stdin_text, chrono::seconds timeout) const {
    json payload = {{"language_id", backend_id},
                    {"source_code", encode(source)},
                    {"stdin", encode(stdin_text)}};

    raw_judge_result result;
    http_response response;
    try {
        response = transport.post(url, "application/json", payload.dump(-1, ' ', false, json::error_handler_t::replace), timeout);
    } catch (timeout_error &e) {
        LOG(WARNING) << "Remote judge timed out after " << timeout.count() << "s";
        result.state = raw_judge_result::state_type::TIMED_OUT;
        result.detail = e.what();
        return result;
    } catch (network_error &e) {
        result.state = raw_judge_result::state_type::FAILED;
        result.detail = e.what();
        return result;
    }

    if (response.status < 200 || response.status >= 300) {
        LOG(ERROR) << "Remote judge responded with HTTP " << response.status << ": " << response.body;
        throw protocol_error(response.status, response.body);
    }

    try {
        result.body = json::parse(response.body);
    } catch (json::parse_error &e) {
        result.state = raw_judge_result::state_type::FAILED;
        result.detail = string("malformed judge response: ") + e.what();
        return result;
    }
    if (!result.body.is_object()) {
        result.state = raw_judge_result::state_type::FAILED;
        result.detail = "malformed judge response: expected a JSON object";
        return result;
    }

    result.state = raw_judge_result::state_type::COMPLETED;
    return result;
}

transport_encoding judge_client::encoding() const {
    return mode;
}

bool judge_client::supports_attachments() const {
    return false;
}

const string &judge_client::endpoint() const {
    return url;
}

}  // namespace runner::remote
