#include "sync/SyncStamp.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <boost/algorithm/string/trim.hpp>

using namespace mfsync::util;
using namespace mfsync::log;

std::time_t mfsync::sync::readSyncStamp(const std::filesystem::path& path) {
    try {
        const auto content = boost::algorithm::trim_copy(readFileToString(path));
        return parseSyncFrom(content);
    } catch (const std::exception& e) {
        Registry::mfsync()->warn("Could not read sync timestamp from {}: {}. Doing a full sync.", path.string(), e.what());
        return 0;
    }
}

void mfsync::sync::writeSyncStamp(const std::filesystem::path& path, const std::time_t startedAt) {
    writeFileAtomically(path, toSyncFromString(startedAt) + "\n");
}
