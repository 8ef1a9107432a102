#include <gtest/gtest.h>
#include "store/model/Entry.hpp"
#include "store/Error.hpp"

#include <nlohmann/json.hpp>

using namespace mfsync::store;
using namespace mfsync::store::model;
using json = nlohmann::json;

TEST(StoreModelTest, ParsesLongListing) {
    const auto j = json::parse(R"({
        "Entries": [
            {"Name": "a.txt", "Type": 0, "Size": 10, "Hash": "QmFile"},
            {"Name": "b", "Type": 1, "Size": 0, "Hash": "QmDir"}
        ]
    })");

    const auto entries = entriesFromListing(j);

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "a.txt");
    EXPECT_FALSE(entries[0].isDirectory());
    EXPECT_EQ(entries[0].size, 10u);
    EXPECT_EQ(entries[0].hash, "QmFile");
    EXPECT_TRUE(entries[1].isDirectory());
}

TEST(StoreModelTest, EmptyDirectoryListsNullEntries) {
    EXPECT_TRUE(entriesFromListing(json::parse(R"({"Entries": null})")).empty());
    EXPECT_TRUE(entriesFromListing(json::object()).empty());
}

TEST(StoreModelTest, ShortListingHasNoSizeOrHash) {
    const auto entries = entriesFromListing(json::parse(R"({"Entries": [{"Name": "x", "Type": 0}]})"));
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].size, 0u);
    EXPECT_TRUE(entries[0].hash.empty());
}

TEST(StoreModelTest, ParsesStat) {
    const auto s = json::parse(R"({
        "Hash": "QmRoot", "Size": 0, "CumulativeSize": 1234, "Blocks": 2, "Type": "directory"
    })").get<Stat>();

    EXPECT_EQ(s.hash, "QmRoot");
    EXPECT_EQ(s.cumulative_size, 1234u);
    EXPECT_EQ(s.type, EntryType::Directory);
}

TEST(StoreModelTest, EntryTypeForms) {
    EXPECT_EQ(parseEntryType(0), EntryType::File);
    EXPECT_EQ(parseEntryType(1), EntryType::Directory);
    EXPECT_EQ(parseEntryType("file"), EntryType::File);
    EXPECT_EQ(parseEntryType("directory"), EntryType::Directory);
    EXPECT_THROW(parseEntryType(2), std::runtime_error);
    EXPECT_THROW(parseEntryType("symlink"), std::runtime_error);
}

TEST(StoreModelTest, EntryToJson) {
    const json j = Entry{"c.txt", EntryType::File, 5, "QmC"};
    EXPECT_EQ(j.at("Name"), "c.txt");
    EXPECT_EQ(j.at("Type"), 0);
    EXPECT_EQ(j.at("Size"), 5);
}

TEST(StoreErrorTest, MessageAndNotFound) {
    const Error e("files/stat", "/backup/x", "file does not exist", 500, 0);
    EXPECT_STREQ(e.what(), "files/stat /backup/x: file does not exist");
    EXPECT_EQ(e.httpStatus(), 500);
    EXPECT_EQ(e.code(), 0);
    EXPECT_TRUE(e.isNotFound());

    EXPECT_FALSE(Error("files/rm", "/x", "permission denied").isNotFound());
}
