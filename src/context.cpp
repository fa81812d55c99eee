#include "braid/context.hpp"

namespace braid {

Context Context::withCancel() {
    Context ctx;
    ctx.state_ = std::make_shared<State>();
    return ctx;
}

Context Context::withTimeout(std::chrono::milliseconds timeout) {
    Context ctx = withCancel();
    ctx.state_->has_deadline = true;
    ctx.state_->deadline = Clock::now() + timeout;
    return ctx;
}

void Context::cancel() const noexcept {
    if (state_) {
        state_->cancelled.store(true, std::memory_order_relaxed);
    }
}

bool Context::isCancelled() const noexcept {
    if (!state_) {
        return false;
    }
    return state_->cancelled.load(std::memory_order_relaxed) || deadlineExceeded();
}

bool Context::deadlineExceeded() const noexcept {
    return state_ && state_->has_deadline && Clock::now() >= state_->deadline;
}

} // namespace braid
