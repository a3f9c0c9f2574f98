#pragma once

#include <filesystem>
#include <string>

namespace runner {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 以二进制方式写入文件，文件已存在时将被覆盖
 * @throw std::system_error 文件无法打开或写入失败
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 name 是一个不含目录的单层文件名
 * 这里用于确保把用户提交的文件写入工作目录时不会出现目录遍历攻击，
 * 如果拿到的文件名包含 "../" 或者绝对路径，那么最后有可能覆盖工作目录以外的文件。
 * 以下文件名都会被拒绝：空串、"."、".."、包含 '/' 或 '\\' 的文件名、包含 '\0' 的文件名。
 * @param name 被检查的文件名
 * @return name 本身
 * @throw invalid_submission 文件名不安全
 */
std::string assert_safe_path(const std::string &name);

/**
 * @brief 在 root 下新建一个名字唯一的文件夹
 * @param root 父文件夹，必须已经存在
 * @param prefix 文件夹名的前缀，后接随机生成的 uuid
 * @return 新建的文件夹路径
 * @throw std::filesystem::filesystem_error 文件夹无法创建（包括文件夹已存在）
 */
std::filesystem::path create_unique_directory(const std::filesystem::path &root, const std::string &prefix);

/**
 * @brief 递归删除文件夹，失败时只记录日志
 * @return 文件夹最终是否已经不存在
 */
bool remove_directory_quietly(const std::filesystem::path &dir) noexcept;

/**
 * @brief 在 PATH 环境变量中查找可执行文件
 * @param name 可执行文件名，如果包含 '/' 则直接检查该路径
 * @return 可执行文件的路径，找不到时返回空路径
 */
std::filesystem::path find_executable(const std::string &name);

}  // namespace runner
