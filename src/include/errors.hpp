#pragma once

#include <stdexcept>
#include <string>

namespace rtreedb {

// Base class of everything the index throws.
class RTreeError : public std::runtime_error {
public:
    explicit RTreeError(const std::string& message)
        : std::runtime_error(message) {}
};

// Invalid fan-out parameters or an unusable persisted configuration.
class ConfigurationError : public RTreeError {
public:
    explicit ConfigurationError(const std::string& message)
        : RTreeError(message) {}
};

class GeometryError : public RTreeError {
public:
    explicit GeometryError(const std::string& message)
        : RTreeError(message) {}
};

// Page store I/O failure or corrupt page. Never retried internally.
class StorageError : public RTreeError {
public:
    explicit StorageError(const std::string& message)
        : RTreeError(message) {}
};

class NodeNotFoundError : public StorageError {
public:
    explicit NodeNotFoundError(int node_id)
        : StorageError("Node " + std::to_string(node_id) + " not found in page store")
        , node_id_(node_id) {}

    [[nodiscard]] int node_id() const noexcept { return node_id_; }

private:
    int node_id_;
};

// Raised only by the structural verifier.
class ConsistencyError : public RTreeError {
public:
    explicit ConsistencyError(const std::string& message)
        : RTreeError(message) {}
};

} // namespace rtreedb
