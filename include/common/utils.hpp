#pragma once

#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::string> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::string &element) {
        cont.push_back(element);
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器（如果 arg 本身为容器，则遍历这个容器将各个元素加入结果容器中）
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, Head &head, Args &... args) {
    to_string_cont<std::decay_t<Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

namespace runner {

/**
 * @brief 子进程的启动参数
 */
struct process_options {
    /**
     * @brief 子进程的工作目录，为空时继承当前进程的工作目录
     */
    std::filesystem::path workdir;

    /**
     * @brief 写入子进程 stdin 的内容，写完后关闭 stdin
     */
    std::string input;

    /**
     * @brief 墙上时钟时间限制，超时后杀死子进程所在的整个进程组
     */
    std::chrono::seconds timeout{10};
};

/**
 * @brief 子进程的运行结果
 */
struct process_result {
    /**
     * @brief 退出码，如果子进程因为信号结束则为 -1
     */
    int exit_code = -1;

    /**
     * @brief 导致子进程结束的信号，正常退出时为 0
     */
    int signal = 0;

    /**
     * @brief 子进程是否因为超时被杀死
     */
    bool timed_out = false;

    std::string out;
    std::string err;

    bool exited_normally() const;
};

/**
 * @brief 执行外部命令，捕获 stdout 和 stderr
 * 子进程运行在新的进程组中，超时后整个进程组会被 SIGKILL 杀死。
 * 子进程结束后立即返回，即使它的后代进程仍然持有 stdout/stderr。
 * 如果 execvp 失败，子进程以 127 退出并在 stderr 中写明原因。
 * @param options 工作目录、stdin 和超时
 * @param argv 外部命令的路径 (argv[0]) 和 参数 (argv)，以 nullptr 结尾
 * @return 子进程的运行结果
 * @throw std::system_error 如果 pipe 或 fork 失败
 */
process_result exec_program(const process_options &options, const char **argv);

/**
 * @brief 调用外部程序
 * @note 与 exec_program(argv) 的区别是，这个函数是类型安全的，而且会自动执行类型转换
 * @note 与 system(cmd) 的区别是，这个函数避免了转义导致的安全问题
 * @param args 转送给应用程序的参数列表，比如可以传入 filesystem::path 给 args[0] 来表示应用程序路径
 * @code{.cpp}
 *     process_options options;
 *     options.timeout = std::chrono::seconds(5);
 *     // 相当于 system("javac -d /tmp/run Main.java");
 *     auto result = call_process(options, "javac", "-d", workdir, sources);
 * @endcode
 */
template <typename... Args>
process_result call_process(const process_options &options, Args &&... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);
    std::vector<const char *> argv(list.size() + 1, nullptr);
    for (size_t i = 0; i < list.size(); ++i)
        argv[i] = list[i].data();

    std::stringstream ss;
    for (size_t i = 0; i < list.size(); ++i)
        ss << argv[i] << ' ';
    LOG(INFO) << "Launching: " << ss.str();

    return exec_program(options, argv.data());
}

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace runner
