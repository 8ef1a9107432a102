#include "sync/ChangeFilter.hpp"

using namespace mfsync::sync;

bool ChangeFilter::shouldUpload(const bool existedRemotely,
                                const model::LocalEntry& local,
                                const std::optional<uint64_t> remoteSize,
                                const model::Options& options) {
    if (!existedRemotely) return true;

    if (options.syncfrom) return local.ctime > *options.syncfrom;

    return !remoteSize || *remoteSize != local.size;
}
