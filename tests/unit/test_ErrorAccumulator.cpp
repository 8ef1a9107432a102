#include <gtest/gtest.h>
#include "sync/ErrorAccumulator.hpp"

#include <stdexcept>

using namespace mfsync::sync;
using mfsync::sync::model::Outcome;

TEST(ErrorAccumulatorTest, StartsClean) {
    ErrorAccumulator errors;
    EXPECT_EQ(errors.count(), 0u);
    EXPECT_EQ(errors.outcome(), Outcome::Clean);
}

TEST(ErrorAccumulatorTest, EveryRecordCounts) {
    ErrorAccumulator errors;
    errors.record("/src/a.txt", "permission denied");
    errors.record(std::filesystem::path("/src/b"), std::runtime_error("boom"));

    EXPECT_EQ(errors.count(), 2u);
    EXPECT_EQ(errors.outcome(), Outcome::WithErrors);
}
