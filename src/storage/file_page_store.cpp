#include "file_page_store.hpp"

#include "page_codec.hpp"

#include <exception>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

namespace rtreedb::storage {

FilePageStore::FilePageStore(std::filesystem::path path, std::size_t dimensions, std::size_t max_node_entries)
    : FilePageStore(std::move(path), dimensions, max_node_entries, Config()) {}

FilePageStore::FilePageStore(std::filesystem::path path, std::size_t dimensions, std::size_t max_node_entries,
                             Config config)
    : path_(std::move(path))
    , dimensions_(dimensions)
    , max_node_entries_(max_node_entries)
    , page_size_(page_codec::page_size(dimensions, max_node_entries))
    , config_(std::move(config))
    , cache_(config_.cache_capacity) {
    if (dimensions_ == 0) {
        throw ConfigurationError("FilePageStore needs at least one dimension");
    }
    if (max_node_entries_ < 2) {
        throw ConfigurationError("FilePageStore needs max_node_entries >= 2");
    }

    const auto parent = path_.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw StorageError("Failed to create directory " + parent.string() + ": " + ec.message());
        }
    }

    file_ = open_page_file(path_.string(), config_.truncate);
    log_message("Opened " + path_.string() + " (page size " + std::to_string(page_size_) + " bytes, " +
                std::to_string(file_size(*file_) / page_size_) + " pages)", false);
}

FilePageStore::~FilePageStore() {
    try {
        close();
    } catch (const std::exception& ex) {
        log_message("Failed to close " + path_.string() + ": " + ex.what(), true);
    }
}

void FilePageStore::log_message(const std::string& message, bool is_error) const {
    if (config_.log_callback) {
        config_.log_callback(message, is_error);
    } else if (is_error) {
        std::cerr << "[FilePageStore ERROR] " << message << std::endl;
    } else if (config_.verbose) {
        std::cout << "[FilePageStore INFO] " << message << std::endl;
    }
}

void FilePageStore::ensure_open() const {
    if (!file_) {
        throw StorageError("FilePageStore " + path_.string() + " is closed");
    }
}

std::uint64_t FilePageStore::page_offset(NodeId id) const {
    return static_cast<std::uint64_t>(id - 1) * page_size_;
}

Node FilePageStore::get_node(NodeId id) {
    ensure_open();
    if (id < 1) {
        throw NodeNotFoundError(id);
    }

    if (const Node* cached = cache_.lookup(id)) {
        ++cache_hits_;
        return *cached;
    }
    ++cache_misses_;

    page_codec::Bytes page(page_size_);
    const std::size_t read = read_at(*file_, page.data(), page_size_, page_offset(id));
    if (read < page_size_) {
        throw NodeNotFoundError(id);
    }
    ++pages_read_;

    // A hole in the file reads back as zeros, i.e. node id 0.
    const unsigned char* prefix = page.data();
    if (page_codec::read_i32(prefix) == 0) {
        throw NodeNotFoundError(id);
    }

    Node node = page_codec::decode_node(page.data(), page.size(), dimensions_, max_node_entries_);
    if (node.id() != id) {
        throw StorageError("Corrupt page " + std::to_string(id) + ": holds node " + std::to_string(node.id()));
    }

    cache_.store(id, node);
    return node;
}

void FilePageStore::store(NodeId id, const Node& node) {
    ensure_open();
    if (id < 1) {
        throw StorageError("Invalid node id " + std::to_string(id));
    }
    if (node.id() != id) {
        throw StorageError("Storing node " + std::to_string(node.id()) + " under id " + std::to_string(id));
    }

    const auto page = page_codec::encode_node(node, dimensions_, page_size_);
    write_at(*file_, page.data(), page.size(), page_offset(id));
    ++pages_written_;
    cache_.store(id, node);
}

void FilePageStore::flush() {
    ensure_open();
    if (config_.sync_on_flush) {
        sync(*file_);
    }
}

void FilePageStore::close() {
    if (!file_) {
        return;
    }
    flush();
    log_message("Closing " + info(), false);
    cache_.clear();
    file_.reset();
}

std::string FilePageStore::info() const {
    std::ostringstream out;
    out << "FilePageStore " << path_.string()
        << " page_size=" << page_size_
        << " cached=" << cache_.size()
        << " hits=" << cache_hits_
        << " misses=" << cache_misses_
        << " reads=" << pages_read_
        << " writes=" << pages_written_;
    return out.str();
}

} // namespace rtreedb::storage
