#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace nlohmann {

/**
 * @brief 判断 j[key] 存在且不为 null
 */
template <typename JsonT>
bool exists(const JsonT &j, const std::string &key) {
    return j.is_object() && j.count(key) && !j.at(key).is_null();
}

template <typename JsonT>
std::invalid_argument build_invalid_argument(const JsonT &, const std::string &key, const std::string &expected) {
    return std::invalid_argument("field '" + key + "' must be " + expected);
}

/**
 * @brief 读取必须存在的字段
 * @throw std::invalid_argument 字段不存在或类型不匹配
 */
template <typename T, typename JsonT>
T get_value(const JsonT &j, const std::string &key, const std::string &expected) {
    if (!exists(j, key))
        throw build_invalid_argument(j, key, expected);
    try {
        return j.at(key).template get<T>();
    } catch (detail::type_error &) {
        throw build_invalid_argument(j, key, expected);
    }
}

/**
 * @brief 读取可选字段，不存在或为 null 时返回 def_value
 * @throw std::invalid_argument 字段存在但类型不匹配
 */
template <typename T, typename JsonT>
T get_value_def(const JsonT &j, const T &def_value, const std::string &key, const std::string &expected) {
    if (!exists(j, key)) return def_value;
    try {
        return j.at(key).template get<T>();
    } catch (detail::type_error &) {
        throw build_invalid_argument(j, key, expected);
    }
}

}  // namespace nlohmann
