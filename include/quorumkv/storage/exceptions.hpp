#pragma once
#include <stdexcept>
#include <string>

namespace quorumkv::storage {

    // Ordinary read/write failure. The caller decides whether to continue.
    class StorageError : public std::runtime_error {
    public:
        explicit StorageError(const std::string& what) : std::runtime_error(what) {}
    };

    // Open, snapshot export or snapshot import failure. The store must not be used
    // for further mutations by the node that hit it.
    class StorageFatalError : public std::runtime_error {
    public:
        explicit StorageFatalError(const std::string& what) : std::runtime_error(what) {}
    };

}
