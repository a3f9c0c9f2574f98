#pragma once

#include "remote/judge_client.hpp"
#include "runner/result.hpp"

namespace runner {

/**
 * @brief 把远程评测服务的原始结果归一化
 *
 * 1. base64 模式下解码 stdout、stderr、compile_output，字段不存在、为 null 或为空串时视为空串；
 *    某个字段解码失败时该字段变为 "<failed to decode 字段名>"，不影响其他字段。
 * 2. 原文模式下字段原样使用。
 * 3. 错误信息优先使用 stderr，stderr 为空时使用 compile_output，都为空时没有错误信息。
 * 4. 只有没有错误信息时 success 才为真。评测服务返回的 status 只作为参考信息，
 *    不参与 success 的计算，避免和某个评测服务配置下的状态编号耦合。
 * 5. 超时结果为 {"", "Execution timed out.", false}，网络错误为 {"", "Execution failed: <原因>", false}。
 */
execution_result normalize(const raw_judge_result &raw, remote::transport_encoding encoding);

/**
 * @brief 把本地沙箱的原始结果归一化
 *
 * 1. 超时（编译或运行）结果为 {"", "Execution timed out.", false}。
 * 2. 编译失败时 output 为空，error 为编译器的诊断信息。
 * 3. 运行结束后 output 为程序的 stdout，stderr 非空时作为 error，退出码为 0 时 success 为真。
 */
execution_result normalize(const local_run_result &raw);

}  // namespace runner
