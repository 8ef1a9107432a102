#pragma once

#include "sync/model/Options.hpp"
#include "sync/model/SymlinkTask.hpp"
#include "store/model/Entry.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mfsync::store { class Store; }

namespace mfsync::sync {

namespace model { struct LocalEntry; }

class FlushScheduler;
class ErrorAccumulator;

// ####################################################################################
// ####################### Recursive local -> MFS reconciliation ######################
// ####################################################################################

class Reconciler {
public:
    Reconciler(store::Store& store,
               const model::Options& options,
               FlushScheduler& scheduler,
               ErrorAccumulator& errors,
               std::filesystem::path localRoot);

    // Makes remoteDir mirror localDir: uploads new or changed files, recurses into
    // subdirectories, deletes remote names with no local counterpart. Symlinks are not
    // touched remotely; they come back as tasks for a later pass.
    //
    // Throws only when remoteDir itself cannot be created. Everything below that is
    // recorded in the error accumulator and the walk moves on.
    std::vector<model::SymlinkTask> reconcile(const std::filesystem::path& localDir,
                                              const std::filesystem::path& remoteDir);

private:
    using RemoteState = std::unordered_map<std::string, store::model::Entry>;

    store::Store& store_;
    const model::Options& options_;
    FlushScheduler& scheduler_;
    ErrorAccumulator& errors_;
    std::filesystem::path localRoot_;

    RemoteState ensureDirectory(const std::filesystem::path& remoteDir);

    void visit(const std::filesystem::path& localPath,
               const std::filesystem::path& remoteDir,
               RemoteState& unseen,
               std::vector<model::SymlinkTask>& symlinks);

    void syncFile(const model::LocalEntry& local,
                  const std::filesystem::path& remotePath,
                  const std::optional<store::model::Entry>& prior);

    [[nodiscard]] model::SymlinkTask deferSymlink(const model::LocalEntry& local) const;

    void removeStale(const std::filesystem::path& remoteDir, const RemoteState& unseen);
};

}
