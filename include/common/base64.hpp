#pragma once

#include <string>

namespace runner {

/**
 * @brief 将任意字节串编码为带 '=' 填充的标准 base64
 */
std::string base64_encode(const std::string &data);

/**
 * @brief 解码标准 base64
 * 输入中的空白字符（Judge0 每 60 个字符插入一个换行）会被忽略。
 * @throw std::invalid_argument 输入包含非法字符、长度不正确或填充位置不正确
 */
std::string base64_decode(const std::string &text);

}  // namespace runner
