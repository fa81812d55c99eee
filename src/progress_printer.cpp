#include "braid/progress_printer.hpp"

#include <cstddef>
#include <iterator>
#include <utility>

#include <fmt/format.h>

namespace braid {

ProgressPrinter::ProgressPrinter(StatSource source, std::ostream& out,
                                 std::chrono::milliseconds interval, TickHook on_tick)
    : source_(std::move(source)), out_(out), interval_(interval), on_tick_(std::move(on_tick)) {}

ProgressPrinter::~ProgressPrinter() { stop(); }

void ProgressPrinter::start() {
    if (thread_.joinable()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
    }
    thread_ = std::thread([this]() { run(); });
}

void ProgressPrinter::stop() {
    if (!thread_.joinable()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    thread_.join();

    printLine();
    out_ << std::flush;
}

void ProgressPrinter::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!cv_.wait_for(lock, interval_, [this] { return stopping_; })) {
        lock.unlock();
        if (on_tick_) {
            on_tick_();
        }
        printLine();
        lock.lock();
    }
}

void ProgressPrinter::printLine() {
    out_ << formatStat(source_ ? source_() : Stat{}) << '\n';
}

std::string ProgressPrinter::formatStat(const Stat& stat) {
    if (stat.total_bytes <= 0) {
        return fmt::format("{} / {}", formatSize(stat.read_bytes), formatSize(stat.total_bytes));
    }

    const double ratio = static_cast<double>(stat.read_bytes) / static_cast<double>(stat.total_bytes);
    return fmt::format("{} / {} {:>3}%",
                       formatSize(stat.read_bytes),
                       formatSize(stat.total_bytes),
                       static_cast<int>(ratio * 100.0));
}

std::string ProgressPrinter::formatSize(std::int64_t bytes) {
    static constexpr const char* kUnits[] = {"KB", "MB", "GB"};

    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }

    double value = static_cast<double>(bytes) / 1024.0;
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(kUnits)) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", value, kUnits[unit]);
}

} // namespace braid
