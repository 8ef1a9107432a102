#pragma once

#include "sync/model/RunResult.hpp"

#include <cstdint>
#include <exception>
#include <filesystem>
#include <string>

namespace mfsync::sync {

// Counts per-entry failures. Each one is logged as it is recorded.
class ErrorAccumulator {
public:
    void record(const std::string& entry, const std::string& cause);
    void record(const std::filesystem::path& entry, const std::exception& cause);

    [[nodiscard]] uint64_t count() const { return count_; }
    [[nodiscard]] model::Outcome outcome() const { return count_ == 0 ? model::Outcome::Clean : model::Outcome::WithErrors; }

private:
    uint64_t count_{};
};

}
