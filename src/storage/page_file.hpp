#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace rtreedb::storage {

// Read-write file descriptor holding fixed-size pages.
struct PageFile {
    int fd = -1;
    std::string path;

    PageFile() = default;
    PageFile(const PageFile&) = delete;
    PageFile& operator=(const PageFile&) = delete;

    ~PageFile() {
        if (fd != -1) {
            ::close(fd);
        }
    }
};

// Opens (creating if needed) `path`; throws StorageError on failure.
std::unique_ptr<PageFile> open_page_file(const std::string& path, bool truncate);

[[nodiscard]] std::uint64_t file_size(const PageFile& file);

// Reads up to `length` bytes at `offset`; returns the number actually read
// (short at end of file).
std::size_t read_at(const PageFile& file, unsigned char* buffer, std::size_t length, std::uint64_t offset);

// Writes all `length` bytes at `offset` or throws StorageError.
void write_at(const PageFile& file, const unsigned char* buffer, std::size_t length, std::uint64_t offset);

void sync(const PageFile& file);

} // namespace rtreedb::storage
