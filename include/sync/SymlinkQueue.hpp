#pragma once

#include "sync/model/SymlinkTask.hpp"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace mfsync::store { class Store; }

namespace mfsync::sync {

class ErrorAccumulator;

// Symlinks found during the walk. They are materialized only after the whole tree has been
// synced and flushed, as plain copies of whatever their target holds remotely by then.
class SymlinkQueue {
public:
    void append(std::vector<model::SymlinkTask> tasks);

    [[nodiscard]] size_t size() const { return tasks_.size(); }

    // Returns the number of links (re)copied. Failures are recorded, never thrown.
    uint64_t materialize(store::Store& store,
                         const std::filesystem::path& remoteRoot,
                         ErrorAccumulator& errors) const;

private:
    std::vector<model::SymlinkTask> tasks_;

    // True when a copy was made.
    static bool materializeOne(store::Store& store,
                               const std::filesystem::path& remoteRoot,
                               const model::SymlinkTask& task);
};

}
