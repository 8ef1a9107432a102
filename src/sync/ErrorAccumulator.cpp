#include "sync/ErrorAccumulator.hpp"
#include "log/Registry.hpp"

using namespace mfsync::sync;
using namespace mfsync::log;

void ErrorAccumulator::record(const std::string& entry, const std::string& cause) {
    Registry::sync()->error("Error processing {}: {}", entry, cause);
    ++count_;
}

void ErrorAccumulator::record(const std::filesystem::path& entry, const std::exception& cause) {
    record(entry.string(), cause.what());
}
