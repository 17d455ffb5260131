#pragma once

#include <type_traits>
#include <utility>

namespace vfsup {

// Runs the stored callable when the scope is left, by return or by exception.
template <typename F>
class ScopeExit {
  public:
    explicit ScopeExit(F fn) : fn_(std::move(fn)) {}

    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;
    ScopeExit(ScopeExit&& other) noexcept(std::is_nothrow_move_constructible_v<F>)
        : fn_(std::move(other.fn_)), active_(other.active_) {
        other.active_ = false;
    }
    ScopeExit& operator=(ScopeExit&&) = delete;

    ~ScopeExit() {
        if (active_) fn_();
    }

    void Release() { active_ = false; }

  private:
    F fn_;
    bool active_ = true;
};

template <typename F>
ScopeExit<std::decay_t<F>> MakeScopeExit(F&& fn) {
    return ScopeExit<std::decay_t<F>>(std::forward<F>(fn));
}

// Runs body, then tail exactly once on every way out of body. The tail must not
// throw: it may already be running during stack unwinding.
template <typename Body, typename Tail>
decltype(auto) RunWithTail(Body&& body, Tail&& tail) {
    auto guard = MakeScopeExit(std::forward<Tail>(tail));
    return std::forward<Body>(body)();
}

} // namespace vfsup
