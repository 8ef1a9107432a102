#pragma once

#include <filesystem>

namespace mfsync::sync::model {

struct SymlinkTask {
    std::filesystem::path source;  // the link, relative to the sync root
    std::filesystem::path target;  // its resolved target, relative to the link's directory

    // Target relative to the sync root; starts with ".." when it escapes the root.
    [[nodiscard]] std::filesystem::path rootRelativeTarget() const {
        return (source.parent_path() / target).lexically_normal();
    }

    friend bool operator==(const SymlinkTask&, const SymlinkTask&) = default;
};

}
