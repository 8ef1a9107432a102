#pragma once

#include "store/model/Entry.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace mfsync::store {

namespace fs = std::filesystem;

struct AddOptions {
    bool pin = false;     // content survives through its MFS reference only
    bool nocopy = false;  // filestore: reference the local file instead of copying its blocks
};

// Client side of the daemon's mutable filesystem. Every call is one blocking round trip
// and throws store::Error on failure. Remote paths are absolute MFS paths.
class Store {
public:
    virtual ~Store() = default;

    [[nodiscard]] virtual std::vector<model::Entry> list(const fs::path& path) const = 0;
    [[nodiscard]] virtual model::Stat stat(const fs::path& path) const = 0;

    // Creates missing parents.
    virtual void mkdir(const fs::path& path) = 0;
    virtual void remove(const fs::path& path, bool recursive) = 0;

    [[nodiscard]] virtual std::string add(const fs::path& localFile, const AddOptions& opts) = 0;

    // Overwrites whatever is at `path`.
    virtual void copyHashTo(const fs::path& path, const std::string& hash) = 0;

    virtual void flush(const fs::path& path) = 0;

    // Whether MFS writes commit implicitly.
    virtual void setAutoflush(bool enabled) = 0;
};

}
