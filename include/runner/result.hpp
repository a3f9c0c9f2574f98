#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "common/utils.hpp"

namespace runner {

/**
 * @brief 本地沙箱超时和远程评测网络超时共用的错误信息
 */
extern const char *EXECUTION_TIMED_OUT;

/**
 * @brief 执行结果，这是唯一对外可见的结果格式
 * 无论是本地沙箱还是远程评测，原始结果都会被 normalizer 归一化为这个结构
 */
struct execution_result {
    /**
     * @brief 程序的标准输出
     */
    std::string output;

    /**
     * @brief 错误信息，没有错误时为空
     * 可能是编译错误、程序的标准错误输出、超时或网络错误
     */
    std::optional<std::string> error;

    bool success = false;

    /**
     * @brief 评测后端的原始响应，仅用于排查问题
     */
    nlohmann::json raw;

    static execution_result timed_out();

    static execution_result failed(const std::string &detail);
};

/**
 * @brief 序列化为 {"output": ..., "error": ...|null, "success": ...}
 * @param include_raw 是否附带 "raw" 字段
 */
nlohmann::json to_json(const execution_result &result, bool include_raw);

/**
 * @brief 本地沙箱的原始结果
 */
struct local_run_result {
    enum class phase_type {
        COMPILE,
        RUN
    };

    /**
     * @brief 结果产生于哪个阶段。编译失败或编译超时时为 COMPILE
     */
    phase_type phase = phase_type::COMPILE;

    process_result process;
};

/**
 * @brief 远程评测服务的原始结果
 */
struct raw_judge_result {
    enum class state_type {
        /**
         * @brief 收到了 2xx 响应，body 为评测服务返回的 JSON
         */
        COMPLETED,

        /**
         * @brief 请求超时
         */
        TIMED_OUT,

        /**
         * @brief 其他网络错误或者响应无法解析，detail 为错误原因
         */
        FAILED
    };

    state_type state = state_type::FAILED;
    nlohmann::json body;
    std::string detail;
};

}  // namespace runner
