#pragma once

#include <string>
#include "runner/language.hpp"

namespace runner {

enum class backend_type {
    LOCAL_SANDBOX,
    REMOTE_JUDGE
};

const char *backend_name(backend_type backend);

/**
 * @brief 决定请求在哪里执行
 * 只有语言需要外部二进制依赖，并且请求中确实带有依赖时才在本地沙箱执行，
 * 否则（即使语言可以在本地执行）都交给远程评测服务，尽量减少本地的工作量。
 */
struct router {
    explicit router(const language_table &languages);

    /**
     * @param language 语言标识，不区分大小写
     * @param has_dependencies 请求中是否带有依赖（jars）
     * @return 执行位置
     * @throw unsupported_language_error 语言不在语言表中，此时不会有任何文件或网络操作
     */
    backend_type route(const std::string &language, bool has_dependencies) const;

private:
    const language_table &languages;
};

}  // namespace runner
