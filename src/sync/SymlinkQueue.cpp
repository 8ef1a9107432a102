#include "sync/SymlinkQueue.hpp"
#include "sync/ErrorAccumulator.hpp"
#include "store/Store.hpp"
#include "store/Error.hpp"
#include "log/Registry.hpp"

#include <iterator>
#include <stdexcept>

using namespace mfsync::sync;
using namespace mfsync::sync::model;
using namespace mfsync::log;
namespace fs = std::filesystem;

void SymlinkQueue::append(std::vector<SymlinkTask> tasks) {
    tasks_.insert(tasks_.end(), std::make_move_iterator(tasks.begin()), std::make_move_iterator(tasks.end()));
}

uint64_t SymlinkQueue::materialize(store::Store& store,
                                   const fs::path& remoteRoot,
                                   ErrorAccumulator& errors) const {
    uint64_t copied = 0;

    for (const auto& task : tasks_) {
        try {
            if (materializeOne(store, remoteRoot, task)) ++copied;
        } catch (const std::exception& e) {
            errors.record((remoteRoot / task.source).generic_string(), e.what());
        }
    }

    return copied;
}

bool SymlinkQueue::materializeOne(store::Store& store, const fs::path& remoteRoot, const SymlinkTask& task) {
    const auto rel = task.rootRelativeTarget();
    if (!rel.empty() && *rel.begin() == "..")
        throw std::runtime_error("symlink target " + task.target.string() + " lies outside the synced tree");

    const fs::path source = remoteRoot / task.source;
    const fs::path target = rel == "." ? remoteRoot : remoteRoot / rel;

    const auto targetStat = store.stat(target);

    try {
        if (store.stat(source).hash == targetStat.hash) return false;
    } catch (const store::Error& e) {
        // nothing at the source yet
        Registry::sync()->trace("{}: {}", source.generic_string(), e.what());
    }

    store.copyHashTo(source, targetStat.hash);
    Registry::sync()->info("{} → {}", targetStat.hash, source.generic_string());
    return true;
}
