#pragma once

#include <chrono>
#include <string>
#include "remote/http_transport.hpp"
#include "runner/result.hpp"

namespace runner::remote {

/**
 * @brief 远程评测服务请求和响应中 source_code、stdin、stdout、stderr、compile_output 的编码方式
 */
enum class transport_encoding {
    PLAIN,
    BASE64
};

/**
 * @brief 根据评测服务地址判断编码方式
 * Judge0 通过查询参数 base64_encoded=true 开启 base64 模式，其他情况均为原文模式。
 * 编码方式必须和地址保持一致，否则评测服务会静默地返回乱码而不是报错。
 */
transport_encoding encoding_of_endpoint(const std::string &url);

/**
 * @brief 远程评测服务（Judge0 兼容）的客户端
 * 客户端在构造时根据地址确定编码方式，之后所有请求都使用同一种编码。
 */
struct judge_client {
    /**
     * @param endpoint 提交地址，比如 https://ce.judge0.com/submissions/?base64_encoded=true&wait=true
     * @param transport HTTP 传输层，生命周期必须长于 judge_client
     */
    judge_client(const std::string &endpoint, http_transport &transport);

    /**
     * @brief 提交一份代码并同步等待结果
     * @param backend_id 评测服务的语言编号
     * @param source 拼接好的源代码（原文）
     * @param stdin_text 标准输入（原文）
     * @param timeout 网络请求的截止时间
     * @return 评测服务的原始结果；超时和网络错误也以结果的形式返回
     * @throw protocol_error 评测服务返回了非 2xx 的状态码
     */
    raw_judge_result submit(int backend_id, const std::string &source, const std::string &stdin_text, std::chrono::seconds timeout) const;

    transport_encoding encoding() const;

    /**
     * @brief 评测服务是否支持结构化的二进制附件
     * Judge0 不支持直接上传 jar，因此总是返回 false，jar 会以注释的形式附加到源代码末尾
     */
    bool supports_attachments() const;

    const std::string &endpoint() const;

private:
    std::string url;
    transport_encoding mode;
    http_transport &transport;

    std::string encode(const std::string &text) const;
};

}  // namespace runner::remote
