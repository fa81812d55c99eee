#include "braid/errors.hpp"
#include "braid/progress_printer.hpp"
#include "braid/request.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

std::atomic<bool> g_interrupted{false};

void onInterrupt(int) { g_interrupted.store(true); }

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName
              << " --url <url> --filename <file> [--jobs <n>] [--user-agent <agent>] [--timeout <seconds>]"
              << std::endl;
    std::cerr << "Options:\n"
              << "  --url <url>           URL to fetch\n"
              << "  --filename <file>     File to write the result to (created or truncated)\n"
              << "  --jobs <n>            Number of parallel range requests (default: " << braid::kDefaultJobs << ")\n"
              << "  --user-agent <agent>  User-Agent header to send\n"
              << "  --timeout <seconds>   Abort the whole fetch after this many seconds (default: none)\n"
              << "  -v, --verbose         Log every range request\n"
              << "  -h, --help            Show this message" << std::endl;
}

int parseInt(const std::string& option, const std::string& value) {
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + option + ": " + value);
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        std::string url;
        std::string filename;
        std::string user_agent;
        int jobs = braid::kDefaultJobs;
        int timeout_seconds = 0;
        bool verbose = false;

        for (int arg_index = 1; arg_index < argc; ++arg_index) {
            const std::string option = argv[arg_index];

            if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            }
            if (option == "-v" || option == "--verbose") {
                verbose = true;
                continue;
            }
            if (arg_index + 1 >= argc) {
                printUsage(argv[0]);
                return 1;
            }

            const std::string value = argv[++arg_index];
            if (option == "--url") {
                url = value;
            } else if (option == "--filename") {
                filename = value;
            } else if (option == "--jobs") {
                jobs = parseInt(option, value);
            } else if (option == "--user-agent") {
                user_agent = value;
            } else if (option == "--timeout") {
                timeout_seconds = parseInt(option, value);
                if (timeout_seconds < 0) {
                    throw std::runtime_error("Timeout must not be negative.");
                }
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }

        if (url.empty() || filename.empty()) {
            std::cerr << "url and filename must be specified" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        auto logger = spdlog::stderr_color_mt("braid");
        logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);

        braid::Request request(logger);
        request.setJobs(jobs);
        request.setUserAgent(user_agent);

        const braid::Context ctx = timeout_seconds > 0
            ? braid::Context::withTimeout(std::chrono::seconds(timeout_seconds))
            : braid::Context::withCancel();
        std::signal(SIGINT, onInterrupt);

        braid::ProgressPrinter printer(
            [&request]() { return request.stats(); }, std::cout, std::chrono::seconds(1),
            // SIGINT is only polled here, so a Ctrl-C cancels within one tick.
            [&ctx]() {
                if (g_interrupted.load()) {
                    ctx.cancel();
                }
            });
        printer.start();

        braid::FetchResult result = request.fetchFile(ctx, url, filename);
        printer.stop();

        if (result.file) {
            result.file->close();
        }
        if (result.has_error) {
            std::cerr << result.error_message << std::endl;
            return 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
