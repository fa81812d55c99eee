#include "braid/errors.hpp"

#include <utility>

namespace braid {

void ErrorCollector::add(std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back(std::move(message));
}

bool ErrorCollector::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.empty();
}

std::size_t ErrorCollector::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

std::string ErrorCollector::combined() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string result;
    for (const auto& message : messages_) {
        if (!result.empty()) {
            result.push_back('\n');
        }
        result += message;
    }
    return result;
}

} // namespace braid
