#pragma once

#include <atomic>
#include <chrono>
#include <memory>

namespace braid {

// Cancellation signal shared by the HEAD request and every range GET.
// Copies share state: cancelling one copy cancels them all.
class Context {
public:
    using Clock = std::chrono::steady_clock;

    // Background context, never cancelled.
    Context() = default;

    [[nodiscard]] static Context withCancel();
    [[nodiscard]] static Context withTimeout(std::chrono::milliseconds timeout);

    void cancel() const noexcept;
    [[nodiscard]] bool isCancelled() const noexcept;
    [[nodiscard]] bool deadlineExceeded() const noexcept;

private:
    struct State {
        std::atomic<bool> cancelled{false};
        bool has_deadline{false};
        Clock::time_point deadline{};
    };

    std::shared_ptr<State> state_;
};

} // namespace braid
