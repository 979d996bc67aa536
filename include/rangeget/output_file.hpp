#pragma once

#include "writer.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace rangeget {

// Destination file. Writes are positional so segments can land in any order
// from any thread.
class OutputFile {
public:
    // Creates or truncates path. Throws std::system_error.
    static OutputFile create(const std::string& path);

    OutputFile() = default;
    ~OutputFile();

    OutputFile(OutputFile&& other) noexcept;
    OutputFile& operator=(OutputFile&& other) noexcept;
    OutputFile(const OutputFile&) = delete;
    OutputFile& operator=(const OutputFile&) = delete;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] bool isOpen() const noexcept { return fd_ >= 0; }

    // The following throw std::system_error on failure.
    [[nodiscard]] std::uint64_t size() const;
    void resize(std::uint64_t size);
    void writeAt(std::uint64_t offset, const char* data, std::size_t size);
    void close();

private:
    OutputFile(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}

    int fd_{-1};
    std::string path_;
};

// Sequential writer over the part of an OutputFile starting at offset.
class OffsetWriter final : public Writer {
public:
    OffsetWriter(OutputFile& file, std::uint64_t offset) : file_(file), position_(offset) {}

    void write(const char* data, std::size_t size) override;

private:
    OutputFile& file_;
    std::uint64_t position_;
};

} // namespace rangeget
