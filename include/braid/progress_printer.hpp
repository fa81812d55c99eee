#pragma once

#include "stat.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>

namespace braid {

// Polls a Stat source on a background thread and prints one line per interval.
class ProgressPrinter {
public:
    using StatSource = std::function<Stat()>;
    using TickHook = std::function<void()>;

    ProgressPrinter(StatSource source, std::ostream& out,
                    std::chrono::milliseconds interval = std::chrono::seconds(1),
                    TickHook on_tick = {});
    ~ProgressPrinter();

    ProgressPrinter(const ProgressPrinter&) = delete;
    ProgressPrinter& operator=(const ProgressPrinter&) = delete;

    void start();
    // Prints a final line and joins the thread. Safe to call more than once.
    void stop();

    static std::string formatStat(const Stat& stat);
    static std::string formatSize(std::int64_t bytes);

private:
    void run();
    void printLine();

    StatSource source_;
    std::ostream& out_;
    std::chrono::milliseconds interval_;
    TickHook on_tick_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_{false};
    std::thread thread_;
};

} // namespace braid
