#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace mfsync::store::model {

enum class EntryType { File, Directory };

// One child of a remote MFS directory, as reported by a long listing.
struct Entry {
    std::string name;
    EntryType type{EntryType::File};
    uint64_t size{};
    std::string hash;

    [[nodiscard]] bool isDirectory() const { return type == EntryType::Directory; }
};

struct Stat {
    std::string hash;
    uint64_t size{};
    uint64_t cumulative_size{};
    EntryType type{EntryType::File};
};

// Accepts both the numeric listing form (0/1) and the textual stat form ("file"/"directory").
EntryType parseEntryType(const nlohmann::json& j);

void from_json(const nlohmann::json& j, Entry& e);
void from_json(const nlohmann::json& j, Stat& s);
void to_json(nlohmann::json& j, const Entry& e);

// "Entries" is null for an empty directory.
std::vector<Entry> entriesFromListing(const nlohmann::json& j);

}
