#include "braid/output_file.hpp"

#include <cerrno>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace braid {

OutputFile::OutputFile(std::string path) : path_(std::move(path)) {
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0666);
    if (fd_ == -1) {
        throw std::system_error(errno, std::generic_category(), "Cannot open destination file " + path_);
    }
}

OutputFile::~OutputFile() { close(); }

std::int64_t OutputFile::writeAt(const char* data, std::size_t size, std::int64_t offset) const noexcept {
    ssize_t written;
    do {
        written = ::pwrite(fd_, data, size, static_cast<off_t>(offset));
    } while (written == -1 && errno == EINTR);
    return static_cast<std::int64_t>(written);
}

std::int64_t OutputFile::size() const {
    struct stat st{};
    if (::fstat(fd_, &st) == -1) {
        throw std::system_error(errno, std::generic_category(), "Cannot stat " + path_);
    }
    return static_cast<std::int64_t>(st.st_size);
}

void OutputFile::sync() const {
    if (::fsync(fd_) == -1) {
        throw std::system_error(errno, std::generic_category(), "Cannot sync " + path_);
    }
}

void OutputFile::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace braid
