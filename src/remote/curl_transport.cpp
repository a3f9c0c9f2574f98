#include <curl/curl.h>
#include <glog/logging.h>
#include <memory>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "remote/http_transport.hpp"

namespace runner::remote {
using namespace std;

static size_t append_to_string(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto *sink = static_cast<string *>(userdata);
    sink->append(ptr, size * nmemb);
    return size * nmemb;
}

// TODO: 针对更多的 CURLcode throw 更加精确的 exception，比如区分 DNS 解析失败和 TLS 握手失败
http_response curl_transport::post(const string &url, const string &content_type, const string &body, chrono::seconds timeout) {
    CURL *curl = curl_easy_init();
    if (!curl) throw network_error("unable to initialize curl");
    defer { curl_easy_cleanup(curl); };

    string content_type_header = "Content-Type: " + content_type;
    curl_slist *headers = curl_slist_append(nullptr, content_type_header.c_str());
    headers = curl_slist_append(headers, "Accept: application/json");
    defer { curl_slist_free_all(headers); };

    http_response response;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)body.size());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_to_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, (long)timeout.count());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        string detail = error_buffer[0] ? string(error_buffer) : string(curl_easy_strerror(res));
        LOG(WARNING) << "POST " << url << " failed: " << detail;
        if (res == CURLE_OPERATION_TIMEDOUT)
            throw timeout_error(detail);
        throw network_error(detail);
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

}  // namespace runner::remote
