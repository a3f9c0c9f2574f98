#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace runner {

/**
 * @brief 一个有序的 "文件名 -> 内容" 表
 * 保持请求中的插入顺序，拼接源文件时按这个顺序输出
 */
typedef std::vector<std::pair<std::string, std::string>> file_list;

/**
 * @brief 表示一次代码执行请求
 * 只能通过 from_json 从请求中构造，构造时完成所有格式检查，之后的模块不再重复检查。
 *
 * @code{.json}
 * {
 *   "language": "java",
 *   "entrypoint": "Main.java",
 *   "files": {"Main.java": "public class Main { ... }"},
 *   "jars": {"gson.jar": "UEsDBBQACAgIAA..."},
 *   "stdin": "3\n4\n",
 *   "timeout_seconds": 10
 * }
 * @endcode
 */
struct submission {
    /**
     * @brief 语言标识，是否受支持由路由器检查
     */
    std::string language;

    /**
     * @brief 程序入口文件名
     * 对于 Java，去掉 .java 扩展名之后就是要运行的主类
     */
    std::string entrypoint;

    /**
     * @brief 源文件，不为空，文件名不重复
     */
    file_list files;

    /**
     * @brief 依赖的二进制文件（jar），内容为 base64 编码
     * 本地沙箱会解码后写入工作目录，远程评测只把它们作为注释附加到源代码后面
     */
    file_list jars;

    /**
     * @brief 程序的标准输入
     */
    std::optional<std::string> stdin_text;

    /**
     * @brief 编译和运行各自的超时时间（秒），为正整数
     */
    int timeout_seconds = 10;

    bool has_jars() const;
};

/**
 * @brief 解析并检查请求
 * @param j 请求，必须使用 ordered_json 解析以保留 files 的顺序
 * @param default_timeout 请求未给出 timeout_seconds 时的超时时间
 * @throw invalid_submission 请求格式不正确
 */
submission parse_submission(const nlohmann::ordered_json &j, int default_timeout);

}  // namespace runner
