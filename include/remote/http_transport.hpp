#pragma once

#include <chrono>
#include <string>

namespace runner::remote {

struct http_response {
    long status = 0;
    std::string body;
};

/**
 * @brief 同步 HTTP 传输层
 * 评测客户端只依赖这个接口，测试时可以替换成 mock
 */
struct http_transport {
    virtual ~http_transport() = default;

    /**
     * @brief 发送一个 POST 请求并阻塞到收到完整响应
     * @param url 请求地址
     * @param content_type 请求体类型，比如 "application/json"
     * @param body 请求体
     * @param timeout 整个请求（连接和传输）的截止时间
     * @return 任何状态码的响应都会正常返回，由调用者判断状态码
     * @throw timeout_error 请求超时
     * @throw network_error 其他网络错误，比如 DNS 解析失败、连接被拒绝
     */
    virtual http_response post(const std::string &url, const std::string &content_type, const std::string &body, std::chrono::seconds timeout) = 0;
};

/**
 * @brief 基于 libcurl 的传输层
 * 每次请求都创建新的 easy handle，因此可以被多个线程同时使用。
 * 进程启动时需要调用一次 curl_global_init。
 */
struct curl_transport : public http_transport {
    http_response post(const std::string &url, const std::string &content_type, const std::string &body, std::chrono::seconds timeout) override;
};

}  // namespace runner::remote
