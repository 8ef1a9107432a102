#include <gtest/gtest.h>
#include "sync/ChangeFilter.hpp"

using namespace mfsync::sync;
using namespace mfsync::sync::model;

class ChangeFilterTest : public ::testing::Test {
protected:
    LocalEntry local;
    Options options;

    void SetUp() override {
        local.name = "a.txt";
        local.path = "/tmp/src/a.txt";
        local.type = LocalEntry::Type::File;
        local.size = 10;
        local.ctime = 1'700'000'000;
    }
};

TEST_F(ChangeFilterTest, NewNameIsAlwaysUploaded) {
    EXPECT_TRUE(ChangeFilter::shouldUpload(false, local, std::nullopt, options));

    options.syncfrom = local.ctime + 3600;
    EXPECT_TRUE(ChangeFilter::shouldUpload(false, local, std::nullopt, options));
}

TEST_F(ChangeFilterTest, SizeMode_EqualSizeIsSkipped) {
    EXPECT_FALSE(ChangeFilter::shouldUpload(true, local, 10, options));
}

TEST_F(ChangeFilterTest, SizeMode_DifferentSizeIsUploaded) {
    EXPECT_TRUE(ChangeFilter::shouldUpload(true, local, 9, options));
    EXPECT_TRUE(ChangeFilter::shouldUpload(true, local, 11, options));
}

TEST_F(ChangeFilterTest, SizeMode_UnknownRemoteSizeIsUploaded) {
    EXPECT_TRUE(ChangeFilter::shouldUpload(true, local, std::nullopt, options));
}

TEST_F(ChangeFilterTest, ChangeTimeMode_AtThresholdIsSkipped) {
    options.syncfrom = local.ctime;
    EXPECT_FALSE(ChangeFilter::shouldUpload(true, local, 999, options));
}

TEST_F(ChangeFilterTest, ChangeTimeMode_AfterThresholdIsUploadedRegardlessOfSize) {
    options.syncfrom = local.ctime - 1;
    EXPECT_TRUE(ChangeFilter::shouldUpload(true, local, 10, options));
}

TEST_F(ChangeFilterTest, ChangeTimeMode_IgnoresSizeDifference) {
    options.syncfrom = local.ctime + 1;
    EXPECT_FALSE(ChangeFilter::shouldUpload(true, local, 12345, options));
}
