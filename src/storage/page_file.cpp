#include "page_file.hpp"

#include "../include/errors.hpp"

#include <cerrno>
#include <cstring>

namespace rtreedb::storage {

namespace {

std::string errno_text() {
    return std::strerror(errno);
}

} // namespace

std::unique_ptr<PageFile> open_page_file(const std::string& path, bool truncate) {
    auto file = std::make_unique<PageFile>();
    file->path = path;

    int flags = O_RDWR | O_CREAT;
    if (truncate) {
        flags |= O_TRUNC;
    }

    file->fd = ::open(path.c_str(), flags, 0644);
    if (file->fd == -1) {
        throw StorageError("Failed to open page file " + path + ": " + errno_text());
    }
    return file;
}

std::uint64_t file_size(const PageFile& file) {
    struct stat sb;
    if (fstat(file.fd, &sb) == -1) {
        throw StorageError("Failed to get file size: " + file.path + ": " + errno_text());
    }
    return static_cast<std::uint64_t>(sb.st_size);
}

std::size_t read_at(const PageFile& file, unsigned char* buffer, std::size_t length, std::uint64_t offset) {
    std::size_t total = 0;
    while (total < length) {
        const ssize_t n = ::pread(file.fd, buffer + total, length - total, static_cast<off_t>(offset + total));
        if (n == -1) {
            if (errno == EINTR) {
                continue;
            }
            throw StorageError("Failed to read " + std::to_string(length) + " bytes at offset " +
                               std::to_string(offset) + " of " + file.path + ": " + errno_text());
        }
        if (n == 0) {
            break;
        }
        total += static_cast<std::size_t>(n);
    }
    return total;
}

void write_at(const PageFile& file, const unsigned char* buffer, std::size_t length, std::uint64_t offset) {
    std::size_t total = 0;
    while (total < length) {
        const ssize_t n = ::pwrite(file.fd, buffer + total, length - total, static_cast<off_t>(offset + total));
        if (n == -1) {
            if (errno == EINTR) {
                continue;
            }
            throw StorageError("Failed to write " + std::to_string(length) + " bytes at offset " +
                               std::to_string(offset) + " of " + file.path + ": " + errno_text());
        }
        total += static_cast<std::size_t>(n);
    }
}

void sync(const PageFile& file) {
    if (::fsync(file.fd) == -1) {
        throw StorageError("Failed to sync " + file.path + ": " + errno_text());
    }
}

} // namespace rtreedb::storage
