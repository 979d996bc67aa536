#include "rangeget/output_file.hpp"

#include <cerrno>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace rangeget {

namespace {

[[noreturn]] void throwErrno(const char* what) {
    throw std::system_error(errno, std::generic_category(), what);
}

} // namespace

OutputFile OutputFile::create(const std::string& path) {
    const int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd == -1) {
        throwErrno(path.c_str());
    }
    return OutputFile{fd, path};
}

OutputFile::~OutputFile() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

OutputFile::OutputFile(OutputFile&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), path_(std::move(other.path_)) {}

OutputFile& OutputFile::operator=(OutputFile&& other) noexcept {
    if (this != &other) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = std::exchange(other.fd_, -1);
        path_ = std::move(other.path_);
    }
    return *this;
}

std::uint64_t OutputFile::size() const {
    struct stat info {};
    if (::fstat(fd_, &info) == -1) {
        throwErrno("stat");
    }
    return static_cast<std::uint64_t>(info.st_size);
}

void OutputFile::resize(std::uint64_t size) {
    if (::ftruncate(fd_, static_cast<off_t>(size)) == -1) {
        throwErrno("truncate");
    }
}

void OutputFile::writeAt(std::uint64_t offset, const char* data, std::size_t size) {
    while (size > 0) {
        const ssize_t written = ::pwrite(fd_, data, size, static_cast<off_t>(offset));
        if (written == -1) {
            if (errno == EINTR) {
                continue;
            }
            throwErrno("write");
        }
        data += written;
        size -= static_cast<std::size_t>(written);
        offset += static_cast<std::uint64_t>(written);
    }
}

void OutputFile::close() {
    if (fd_ < 0) {
        return;
    }
    const int fd = std::exchange(fd_, -1);
    if (::close(fd) == -1) {
        throwErrno("close");
    }
}

void OffsetWriter::write(const char* data, std::size_t size) {
    file_.writeAt(position_, data, size);
    position_ += size;
}

} // namespace rangeget
