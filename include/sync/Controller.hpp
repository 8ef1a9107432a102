#pragma once

#include "sync/FlushScheduler.hpp"
#include "sync/model/Options.hpp"
#include "sync/model/RunResult.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace mfsync::store { class Store; }

namespace mfsync::sync {

// One run, strictly in this order. No phase is entered twice.
enum class Phase { Init, TreeWalk, Flush1, SymlinkPass, Flush2, Report };

std::string to_string(Phase phase);

class Controller {
public:
    Controller(std::shared_ptr<store::Store> store,
               model::Options options,
               FlushScheduler::NowFn now = &FlushScheduler::Clock::now);

    // Mirrors src into the MFS path dst and returns the resulting root hash with the
    // number of entries that failed. Throws when the run cannot start or a phase-level
    // flush/stat fails; no partial result is produced then.
    model::RunResult run(const std::filesystem::path& src, const std::filesystem::path& dst);

    [[nodiscard]] Phase phase() const { return phase_; }
    [[nodiscard]] const model::Options& options() const { return options_; }

private:
    std::shared_ptr<store::Store> store_;
    model::Options options_;
    FlushScheduler::NowFn now_;
    Phase phase_{Phase::Init};

    void enter(Phase phase);

    static std::filesystem::path resolveSource(const std::filesystem::path& src);
    static std::filesystem::path resolveDestination(const std::filesystem::path& dst);
};

}
