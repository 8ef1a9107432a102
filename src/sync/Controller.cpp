#include "sync/Controller.hpp"
#include "sync/ErrorAccumulator.hpp"
#include "sync/Reconciler.hpp"
#include "sync/SymlinkQueue.hpp"
#include "store/Store.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

#include <stdexcept>

using namespace mfsync::sync;
using namespace mfsync::sync::model;
using namespace mfsync::log;
namespace fs = std::filesystem;

std::string mfsync::sync::to_string(const Phase phase) {
    switch (phase) {
        case Phase::Init: return "init";
        case Phase::TreeWalk: return "tree walk";
        case Phase::Flush1: return "first flush";
        case Phase::SymlinkPass: return "symlink pass";
        case Phase::Flush2: return "final flush";
        case Phase::Report: return "report";
        default: return "unknown";
    }
}

Controller::Controller(std::shared_ptr<store::Store> store, Options options, FlushScheduler::NowFn now)
    : store_(std::move(store)), options_(std::move(options)), now_(std::move(now)) {
    if (!store_) throw std::invalid_argument("Controller requires a store");
}

RunResult Controller::run(const fs::path& src, const fs::path& dst) {
    phase_ = Phase::Init;

    const auto localRoot = resolveSource(src);
    const auto remoteRoot = resolveDestination(dst);

    // zero interval: every write commits by itself and the scheduler stays idle
    store_->setAutoflush(options_.flush_interval && options_.flush_interval->count() == 0);

    ErrorAccumulator errors;
    FlushScheduler scheduler(options_.flush_interval, [&] { store_->flush(remoteRoot); }, now_);
    SymlinkQueue symlinks;

    enter(Phase::TreeWalk);
    Reconciler reconciler(*store_, options_, scheduler, errors, localRoot);
    symlinks.append(reconciler.reconcile(localRoot, remoteRoot));

    enter(Phase::Flush1);
    store_->flush(remoteRoot);

    enter(Phase::SymlinkPass);
    const auto copied = symlinks.materialize(*store_, remoteRoot, errors);
    Registry::sync()->debug("{} of {} symlinks copied", copied, symlinks.size());

    enter(Phase::Flush2);
    store_->flush(remoteRoot);

    enter(Phase::Report);
    RunResult result{store_->stat(remoteRoot).hash, errors.count(), errors.outcome()};

    Registry::mfsync()->debug("Run finished with {} error(s), {} scheduled flush(es)",
                              result.errors, scheduler.flushes());
    return result;
}

void Controller::enter(const Phase phase) {
    if (static_cast<int>(phase) <= static_cast<int>(phase_))
        throw std::logic_error(fmt::format("Phase {} entered after {}", to_string(phase), to_string(phase_)));
    phase_ = phase;
}

fs::path Controller::resolveSource(const fs::path& src) {
    std::error_code ec;
    const auto root = fs::canonical(src, ec);
    if (ec) throw std::runtime_error(fmt::format("Could not canonicalize source path {}: {}", src.string(), ec.message()));

    if (!fs::is_directory(root, ec))
        throw std::runtime_error(fmt::format("Source path {} is not a directory", root.string()));

    return root;
}

fs::path Controller::resolveDestination(const fs::path& dst) {
    if (dst.empty() || !dst.is_absolute())
        throw std::runtime_error(fmt::format("Destination {} must be an absolute MFS path", dst.generic_string()));

    auto root = dst.lexically_normal();
    if (!root.has_filename() && root != root.root_path()) root = root.parent_path();
    return root;
}
