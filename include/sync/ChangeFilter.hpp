#pragma once

#include "sync/model/LocalEntry.hpp"
#include "sync/model/Options.hpp"

#include <cstdint>
#include <optional>

namespace mfsync::sync {

// Decides whether a local file must be (re)uploaded.
//
// Without `syncfrom` a file counts as changed when its size differs from the remote size.
// A same-length edit goes unnoticed.
//
// With `syncfrom = T` a file counts as changed when its change-time is after T. Size is not
// consulted; a file whose ctime did not advance past T is missed.
//
// A name that did not exist remotely is always uploaded.
struct ChangeFilter {
    [[nodiscard]] static bool shouldUpload(bool existedRemotely,
                                           const model::LocalEntry& local,
                                           std::optional<uint64_t> remoteSize,
                                           const model::Options& options);
};

}
