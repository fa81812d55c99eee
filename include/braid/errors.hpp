#pragma once

#include <cstddef>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace braid {

// Thrown for failures that stop a fetch before any worker is launched.
class FetchError : public std::runtime_error {
public:
    enum class Kind {
        FileOpen,
        Metadata,
    };

    FetchError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

// Collects worker failures in arrival order. Safe to add from any thread.
class ErrorCollector {
public:
    void add(std::string message);

    [[nodiscard]] bool empty() const;
    [[nodiscard]] std::size_t count() const;
    [[nodiscard]] std::string combined() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> messages_;
};

} // namespace braid
