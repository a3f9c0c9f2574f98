#pragma once

#include "remote/judge_client.hpp"
#include "runner/language.hpp"
#include "runner/result.hpp"
#include "runner/router.hpp"
#include "runner/submission.hpp"
#include "sandbox/local_sandbox.hpp"

namespace runner {

/**
 * @brief 执行一次请求：检查语言、选择执行位置、执行、归一化结果
 * dispatcher 本身没有可变状态，可以被多个线程同时调用。
 */
struct dispatcher {
    /**
     * @param languages 语言表
     * @param local 本地沙箱
     * @param client 远程评测客户端
     * 三者的生命周期都必须长于 dispatcher
     */
    dispatcher(const language_table &languages, const sandbox::local_sandbox &local, const remote::judge_client &client);

    /**
     * @brief 执行一次请求
     * @return 归一化后的结果，编译失败、运行失败、超时、网络错误都以结果的形式返回
     * @throw unsupported_language_error 语言不受支持，此时没有任何文件或网络操作
     * @throw invalid_submission 请求格式不正确（比如文件名不安全）
     * @throw protocol_error 远程评测服务返回了非 2xx 状态码
     */
    execution_result dispatch(const submission &submit) const;

private:
    const language_table &languages;
    router route;
    const sandbox::local_sandbox &local;
    const remote::judge_client &client;

    execution_result run_locally(const submission &submit, const language_descriptor &lang) const;
    execution_result run_remotely(const submission &submit, const language_descriptor &lang) const;
};

}  // namespace runner
