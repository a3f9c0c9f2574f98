#pragma once

#include <filesystem>
#include <string>

namespace runner {

/**
 * @brief 默认的远程评测服务地址
 * 地址中的 base64_encoded 查询参数决定了请求和响应的编码方式，参见 remote::encoding_of_endpoint
 */
extern const char *DEFAULT_JUDGE_ENDPOINT;

/**
 * @brief 远程评测服务（Judge0 兼容）的提交地址
 * @defaultValue DEFAULT_JUDGE_ENDPOINT，可以通过 --endpoint 或者环境变量 JUDGE0_URL 修改
 */
extern std::string JUDGE_ENDPOINT;

/**
 * @brief 本地沙箱的工作目录根目录
 * 每个请求都会在这里新建一个独立的文件夹，请求结束后删除
 *
 * WORKSPACE_DIR
 * ├── run-0f8fad5b-d9cb-469f-a165-70867728950e // 一个请求的临时工作目录
 * │   ├── Main.java // 用户提交的源文件
 * │   ├── Main.class // 编译产物
 * │   └── gson.jar // 用户提交的依赖
 * └── ...
 *
 * @defaultValue 系统临时目录，可以通过 --workspace-dir 或者环境变量 WORKSPACEDIR 修改
 */
extern std::filesystem::path WORKSPACE_DIR;

/**
 * @brief 本地编译器，默认在 PATH 中查找 javac
 */
extern std::string JAVAC_PATH;

/**
 * @brief 本地运行时，默认在 PATH 中查找 java
 */
extern std::string JAVA_PATH;

/**
 * @brief 请求未指定 timeout_seconds 时使用的超时时间（秒）
 */
extern int DEFAULT_TIMEOUT;

/**
 * @brief 解析以秒为单位的超时配置，比如环境变量 TIMEOUT 的值
 * @throw std::invalid_argument text 不是正整数
 */
int parse_timeout_setting(const std::string &text);

/**
 * @brief 语言表配置文件，为空时使用内置的语言表
 */
extern std::filesystem::path LANGUAGES_FILE;

/**
 * @brief 输出结果时是否附带评测后端的原始响应，便于排查问题
 */
extern bool INCLUDE_RAW;

}  // namespace runner
