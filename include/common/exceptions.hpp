#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace runner {

struct runner_exception : std::exception {
    runner_exception();
    explicit runner_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const runner_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示网络错误，通常由 CURL 产生
 */
struct network_error : public runner_exception {
    network_error();
    explicit network_error(const std::string &message);
};

/**
 * @brief 表示网络请求超时
 * 远程评测客户端会将其转换为 "Execution timed out." 结果，而不是继续抛出
 */
struct timeout_error : public network_error {
    timeout_error();
    explicit timeout_error(const std::string &message);
};

/**
 * @brief 表示请求在执行之前就被拒绝（客户端错误）
 * 比如语言不受支持、文件表为空、文件名不安全
 */
struct rejection_error : public runner_exception {
    rejection_error();
    explicit rejection_error(const std::string &message);
};

/**
 * @brief 请求的语言不在语言表中
 */
struct unsupported_language_error : public rejection_error {
    const std::string language;

    explicit unsupported_language_error(const std::string &language);
};

/**
 * @brief 请求的格式不正确
 * 比如 files 为空、timeout_seconds 不是正整数、jars 不是合法的 base64
 */
struct invalid_submission : public rejection_error {
    explicit invalid_submission(const std::string &message);
};

/**
 * @brief 远程评测服务返回了非 2xx 的 HTTP 状态码
 * 说明运行器构造的请求本身有误，需要原样报告给调用者
 */
struct protocol_error : public runner_exception {
    protocol_error(long status_code, const std::string &body);

    long status_code() const noexcept;
    const std::string &body() const noexcept;

private:
    long status;
    std::string response_body;
};

}  // namespace runner
