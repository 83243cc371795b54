#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <iterator>
#include <list>
#include <memory>
#include <string>
#include <unordered_map>

#include "page_file.hpp"
#include "page_store.hpp"

namespace rtreedb::storage {

// One fixed-size page per node id in a single data file, with a
// write-through LRU cache of decoded nodes in front of it.
class FilePageStore final : public PageStore {
public:
    // Logging callback type for error reporting
    using LogCallback = std::function<void(const std::string& message, bool is_error)>;

    struct Config {
        std::size_t cache_capacity = 256;   // decoded nodes kept in memory, 0 disables
        bool truncate = false;              // discard existing pages on open
        bool sync_on_flush = true;          // fsync the data file in flush()
        bool verbose = false;
        LogCallback log_callback;
    };

    FilePageStore(std::filesystem::path path, std::size_t dimensions, std::size_t max_node_entries);
    FilePageStore(std::filesystem::path path, std::size_t dimensions, std::size_t max_node_entries, Config config);
    ~FilePageStore() override;

    FilePageStore(const FilePageStore&) = delete;
    FilePageStore& operator=(const FilePageStore&) = delete;

    [[nodiscard]] Node get_node(NodeId id) override;
    void store(NodeId id, const Node& node) override;
    void flush() override;
    void close() override;
    [[nodiscard]] std::string info() const override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::size_t page_size() const noexcept { return page_size_; }
    [[nodiscard]] bool is_open() const noexcept { return file_ != nullptr; }

    [[nodiscard]] std::size_t cache_hits() const noexcept { return cache_hits_; }
    [[nodiscard]] std::size_t cache_misses() const noexcept { return cache_misses_; }
    [[nodiscard]] std::size_t pages_read() const noexcept { return pages_read_; }
    [[nodiscard]] std::size_t pages_written() const noexcept { return pages_written_; }

private:
    class NodeCache {
    public:
        explicit NodeCache(std::size_t capacity)
            : capacity_(capacity) {}

        [[nodiscard]] bool enabled() const noexcept { return capacity_ > 0; }

        const Node* lookup(NodeId id) {
            if (!enabled()) {
                return nullptr;
            }

            const auto it = map_.find(id);
            if (it == map_.end()) {
                return nullptr;
            }

            entries_.splice(entries_.begin(), entries_, it->second);
            return &entries_.front().node;
        }

        void store(NodeId id, const Node& node) {
            if (!enabled()) {
                return;
            }

            const auto it = map_.find(id);
            if (it != map_.end()) {
                it->second->node = node;
                entries_.splice(entries_.begin(), entries_, it->second);
                return;
            }

            if (map_.size() == capacity_) {
                auto tail = std::prev(entries_.end());
                map_.erase(tail->id);
                entries_.pop_back();
            }

            entries_.push_front(CacheEntry{id, node});
            map_[id] = entries_.begin();
        }

        void clear() {
            entries_.clear();
            map_.clear();
        }

        [[nodiscard]] std::size_t size() const noexcept { return map_.size(); }

    private:
        struct CacheEntry {
            NodeId id;
            Node node;
        };

        using CacheList = std::list<CacheEntry>;
        using CacheMap = std::unordered_map<NodeId, CacheList::iterator>;

        std::size_t capacity_ = 0;
        CacheList entries_;
        CacheMap map_;
    };

    void log_message(const std::string& message, bool is_error) const;
    void ensure_open() const;
    [[nodiscard]] std::uint64_t page_offset(NodeId id) const;

    std::filesystem::path path_;
    std::size_t dimensions_;
    std::size_t max_node_entries_;
    std::size_t page_size_;
    Config config_;
    std::unique_ptr<PageFile> file_;
    NodeCache cache_;

    std::size_t cache_hits_ = 0;
    std::size_t cache_misses_ = 0;
    std::size_t pages_read_ = 0;
    std::size_t pages_written_ = 0;
};

} // namespace rtreedb::storage
