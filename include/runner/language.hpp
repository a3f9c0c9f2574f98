#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace runner {

/**
 * @brief 描述一种编程语言如何被执行
 */
struct language_descriptor {
    /**
     * @brief 语言标识，小写，比如 "cpp"、"java"
     */
    std::string id;

    /**
     * @brief 远程评测服务中的语言编号（Judge0 的 language_id）
     * 只有远程评测客户端关心这个值的含义
     */
    int backend_id = 0;

    /**
     * @brief 单行注释的前缀，拼接源文件时用来生成 "// FILE: Main.java" 这样的分隔行
     */
    std::string comment_token;

    /**
     * @brief 是否需要在本地沙箱中执行
     * 对于 Java，如果提交中带有 jar 依赖，远程评测服务无法处理，需要在本地编译运行
     */
    bool requires_local_sandbox = false;

    /**
     * @brief 源文件扩展名，比如 ".java"
     * 本地沙箱用它挑选需要编译的文件，并从入口文件名推导出要运行的类名
     */
    std::string source_extension;
};

void from_json(const nlohmann::json &j, language_descriptor &lang);
void to_json(nlohmann::json &j, const language_descriptor &lang);

/**
 * @brief 语言表
 * 进程启动时构造一次，之后只读，因此可以在多个线程之间共享而不需要加锁。
 * 查找时语言标识不区分大小写。
 */
class language_table {
public:
    explicit language_table(std::vector<language_descriptor> languages);

    /**
     * @brief 查找语言
     * @param language 语言标识，不区分大小写
     * @return 语言描述，找不到时返回 nullptr
     */
    const language_descriptor *find(const std::string &language) const;

    /**
     * @brief 查找语言
     * @throw unsupported_language_error 语言不在表中
     */
    const language_descriptor &at(const std::string &language) const;

    /**
     * @brief 按注册顺序返回所有语言标识
     */
    std::vector<std::string> identifiers() const;

    /**
     * @brief 内置的语言表
     * c, cpp, java, python, javascript, ruby, go, bash
     */
    static language_table defaults();

    /**
     * @brief 从 JSON 配置文件加载语言表
     * @code{.json}
     * {"languages": [{"id": "java", "backend_id": 62, "comment_token": "//", "requires_local_sandbox": true, "source_extension": ".java"}]}
     * @endcode
     * @throw std::invalid_argument 配置文件格式不正确
     */
    static language_table load(const std::filesystem::path &path);

private:
    std::vector<language_descriptor> entries;
    std::unordered_map<std::string, size_t> index;
};

}  // namespace runner
