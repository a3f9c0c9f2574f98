#include "common/defer.hpp"
#include <glog/logging.h>
#include <exception>

namespace runner {

scoped_guard::scoped_guard() : f() {}

scoped_guard::scoped_guard(const std::function<void()> &f) : f(f) {}

scoped_guard::scoped_guard(scoped_guard &&other) noexcept : f(std::move(other.f)) {
    other.f = nullptr;
}

scoped_guard::~scoped_guard() {
    if (!f) return;
    try {
        f();
    } catch (std::exception &e) {
        LOG(WARNING) << "Deferred action failed: " << e.what();
    }
}

scoped_guard scoped_guard::operator+(const std::function<void()> &f) const {
    return scoped_guard(f);
}

void scoped_guard::dismiss() noexcept {
    f = nullptr;
}

}  // namespace runner
