#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace braid {

// Destination file opened write-only, created if missing and truncated.
// writeAt() never touches a shared file offset, so several threads may
// write disjoint spans concurrently without extra locking.
class OutputFile {
public:
    // Throws std::system_error when the file cannot be opened.
    explicit OutputFile(std::string path);
    ~OutputFile();

    OutputFile(const OutputFile&) = delete;
    OutputFile& operator=(const OutputFile&) = delete;

    // Returns the number of bytes written; -1 on error with errno set.
    [[nodiscard]] std::int64_t writeAt(const char* data, std::size_t size, std::int64_t offset) const noexcept;

    // Throws std::system_error on failure.
    [[nodiscard]] std::int64_t size() const;
    void sync() const;
    void close() noexcept;

    [[nodiscard]] bool isOpen() const noexcept { return fd_ >= 0; }
    [[nodiscard]] int fd() const noexcept { return fd_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
    int fd_{-1};
};

using OutputFilePtr = std::unique_ptr<OutputFile>;

} // namespace braid
