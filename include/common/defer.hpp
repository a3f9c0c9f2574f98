#pragma once

#include <functional>

#define DEFER_1(x, y) x##y
#define DEFER_2(x, y) DEFER_1(x, y)
#define DEFER_0(x) DEFER_2(x, __COUNTER__)

/**
 * @brief 在离开当前作用域时执行代码块，无论是正常返回还是抛出异常
 * @code{.cpp}
 *     auto dir = create_unique_directory(root, "run-");
 *     defer { remove_directory_quietly(dir); };
 * @endcode
 */
#define defer auto DEFER_0(_defered_option) = runner::scoped_guard() + [&]()

namespace runner {

/**
 * @brief 作用域守卫，析构时执行一次 f
 * f 抛出的异常会被记录到日志并吞掉，析构函数不会向外抛出异常
 */
struct scoped_guard {
    std::function<void()> f;

    scoped_guard();
    scoped_guard(const std::function<void()> &f);
    scoped_guard(scoped_guard &&other) noexcept;
    scoped_guard(const scoped_guard &) = delete;
    ~scoped_guard();

    scoped_guard &operator=(const scoped_guard &) = delete;

    scoped_guard operator+(const std::function<void()> &f) const;

    /**
     * @brief 放弃执行
     */
    void dismiss() noexcept;
};

}  // namespace runner
