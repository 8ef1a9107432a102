#pragma once

#include <ctime>
#include <filesystem>

namespace mfsync::sync {

// The stamp file holds one "@<unix-seconds>" line: the start time of the last clean run.

// Returns 0 when the file is missing or unreadable, which forces a full comparison.
std::time_t readSyncStamp(const std::filesystem::path& path);

void writeSyncStamp(const std::filesystem::path& path, std::time_t startedAt);

}
