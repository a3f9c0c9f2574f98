#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include "runner/language.hpp"
#include "runner/result.hpp"
#include "runner/submission.hpp"

namespace runner::sandbox {

/**
 * @brief 本地工具链
 * 编译命令：<compiler> -encoding UTF-8 [-cp <依赖>] -d <工作目录> <源文件...>
 * 运行命令：<runtime> -cp <依赖>:<工作目录> <主类>
 */
struct toolchain {
    /**
     * @brief 编译器，不含 '/' 时在 PATH 中查找
     */
    std::string compiler = "javac";

    /**
     * @brief 运行时，不含 '/' 时在 PATH 中查找
     */
    std::string runtime = "java";

    /**
     * @brief 依赖路径的分隔符
     */
#ifdef _WIN32
    std::string path_separator = ";";
#else
    std::string path_separator = ":";
#endif
};

/**
 * @brief 本地沙箱
 * 为每个请求新建一个独立的临时工作目录，把源文件和依赖写入工作目录，先编译再运行。
 * 工作目录在请求结束时（成功、失败、超时或者抛出异常）一定会被删除，且只删除一次。
 * 多个请求可以同时调用 execute，请求之间不共享任何可变状态。
 */
struct local_sandbox {
    /**
     * @param workspace_root 临时工作目录的父目录，必须已经存在
     * @param tools 编译器和运行时
     */
    local_sandbox(const std::filesystem::path &workspace_root, toolchain tools);

    /**
     * @brief 编译并运行一次提交
     * @param submit 提交，files、jars 的名字会在写入任何文件之前检查
     * @param lang 提交的语言，用来确定源文件扩展名
     * @return 编译失败时为编译阶段的结果，否则为运行阶段的结果
     * @throw invalid_submission 文件名不安全、jar 不是合法的 base64、没有可编译的源文件
     * @throw std::system_error 无法启动编译器或运行时
     */
    local_run_result execute(const submission &submit, const language_descriptor &lang) const;

    const std::filesystem::path &workspace_root() const;

private:
    std::filesystem::path root;
    toolchain tools;
};

/**
 * @brief 根据入口文件名推导要运行的单元名
 * @code{.cpp}
 *     runnable_unit_name("Main.java", ".java") == "Main"
 * @endcode
 */
std::string runnable_unit_name(const std::string &entrypoint, const std::string &extension);

}  // namespace runner::sandbox
