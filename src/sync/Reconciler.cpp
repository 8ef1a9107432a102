#include "sync/Reconciler.hpp"
#include "sync/ChangeFilter.hpp"
#include "sync/ErrorAccumulator.hpp"
#include "sync/FlushScheduler.hpp"
#include "sync/model/LocalEntry.hpp"
#include "store/Store.hpp"
#include "store/Error.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace mfsync::sync;
using namespace mfsync::sync::model;
using namespace mfsync::log;
namespace fs = std::filesystem;

Reconciler::Reconciler(store::Store& store,
                       const Options& options,
                       FlushScheduler& scheduler,
                       ErrorAccumulator& errors,
                       fs::path localRoot)
    : store_(store), options_(options), scheduler_(scheduler), errors_(errors), localRoot_(std::move(localRoot)) {}

std::vector<SymlinkTask> Reconciler::reconcile(const fs::path& localDir, const fs::path& remoteDir) {
    Registry::sync()->debug("Entering {}", remoteDir.generic_string());

    auto unseen = ensureDirectory(remoteDir);
    std::vector<SymlinkTask> symlinks;

    std::error_code ec;
    fs::directory_iterator it(localDir, ec);
    if (ec) {
        // unreadable: no stale deletion
        errors_.record(localDir, fs::filesystem_error("Could not read directory", localDir, ec));
        return symlinks;
    }

    for (const fs::directory_iterator end; it != end;) {
        const auto path = it->path();
        try {
            visit(path, remoteDir, unseen, symlinks);
        } catch (const std::exception& e) {
            errors_.record(path, e);
        }

        it.increment(ec);
        if (ec) {
            errors_.record(localDir, fs::filesystem_error("Directory iteration failed", localDir, ec));
            return symlinks;
        }
    }

    removeStale(remoteDir, unseen);
    return symlinks;
}

Reconciler::RemoteState Reconciler::ensureDirectory(const fs::path& remoteDir) {
    RemoteState state;

    try {
        for (auto& e : store_.list(remoteDir)) {
            auto name = e.name;
            state.emplace(std::move(name), std::move(e));
        }
        return state;
    } catch (const store::Error& e) {
        Registry::sync()->trace("Listing {} failed: {}", remoteDir.generic_string(), e.what());
    }

    try {
        store_.remove(remoteDir, true);
    } catch (const store::Error& e) {
        Registry::sync()->trace("Clearing {} failed: {}", remoteDir.generic_string(), e.what());
    }

    store_.mkdir(remoteDir);
    Registry::sync()->info("{} → {}", store_.stat(remoteDir).hash, remoteDir.generic_string());
    return state;
}

void Reconciler::visit(const fs::path& localPath,
                       const fs::path& remoteDir,
                       RemoteState& unseen,
                       std::vector<SymlinkTask>& symlinks) {
    std::optional<store::model::Entry> prior;
    if (const auto node = unseen.extract(localPath.filename().string()))
        prior = node.mapped();

    const auto local = LocalEntry::fromPath(localPath);
    const auto remotePath = remoteDir / local.name;

    switch (local.type) {
    case LocalEntry::Type::Directory: {
        if (prior && !prior->isDirectory()) store_.remove(remotePath, true);
        auto nested = reconcile(local.path, remotePath);
        symlinks.insert(symlinks.end(), nested.begin(), nested.end());
        return;
    }
    case LocalEntry::Type::Symlink: {
        auto task = deferSymlink(local);
        Registry::sync()->debug("Postponing symlink {} → {}", task.source.string(), task.target.string());
        symlinks.push_back(std::move(task));
        return;
    }
    case LocalEntry::Type::File:
        syncFile(local, remotePath, prior);
        return;
    case LocalEntry::Type::Other:
        break;
    }

    throw std::runtime_error("unsupported file type");
}

void Reconciler::syncFile(const LocalEntry& local,
                          const fs::path& remotePath,
                          const std::optional<store::model::Entry>& prior) {
    // a directory under the same name does not count as a previous version
    const bool existed = prior && !prior->isDirectory();
    const auto remoteSize = existed ? std::optional<uint64_t>(prior->size) : std::nullopt;

    if (!ChangeFilter::shouldUpload(existed, local, remoteSize, options_)) return;

    const auto hash = store_.add(local.path, {.pin = false, .nocopy = options_.nocopy});
    store_.copyHashTo(remotePath, hash);
    Registry::sync()->info("{} → {}", hash, remotePath.generic_string());

    scheduler_.tick();
}

SymlinkTask Reconciler::deferSymlink(const LocalEntry& local) const {
    const auto resolved = fs::canonical(local.path);
    return {
        .source = local.path.lexically_relative(localRoot_),
        .target = resolved.lexically_relative(local.path.parent_path()),
    };
}

void Reconciler::removeStale(const fs::path& remoteDir, const RemoteState& unseen) {
    for (const auto& [name, entry] : unseen) {
        const auto remotePath = remoteDir / name;
        try {
            store_.remove(remotePath, true);
            Registry::sync()->debug("Removed {}", remotePath.generic_string());
        } catch (const std::exception& e) {
            errors_.record(remotePath, e);
        }
    }
}
