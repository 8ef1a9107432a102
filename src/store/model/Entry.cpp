#include "store/model/Entry.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace mfsync::store::model;

EntryType mfsync::store::model::parseEntryType(const nlohmann::json& j) {
    if (j.is_number_integer()) {
        switch (j.get<int>()) {
        case 0: return EntryType::File;
        case 1: return EntryType::Directory;
        default: throw std::runtime_error("Unknown entry type: " + j.dump());
        }
    }

    if (j.is_string()) {
        const auto s = j.get<std::string>();
        if (s == "file") return EntryType::File;
        if (s == "directory") return EntryType::Directory;
    }

    throw std::runtime_error("Unknown entry type: " + j.dump());
}

void mfsync::store::model::from_json(const nlohmann::json& j, Entry& e) {
    j.at("Name").get_to(e.name);
    e.type = parseEntryType(j.at("Type"));
    e.size = j.value("Size", static_cast<uint64_t>(0));
    e.hash = j.value("Hash", std::string{});
}

void mfsync::store::model::from_json(const nlohmann::json& j, Stat& s) {
    j.at("Hash").get_to(s.hash);
    s.size = j.value("Size", static_cast<uint64_t>(0));
    s.cumulative_size = j.value("CumulativeSize", static_cast<uint64_t>(0));
    s.type = j.contains("Type") ? parseEntryType(j.at("Type")) : EntryType::File;
}

void mfsync::store::model::to_json(nlohmann::json& j, const Entry& e) {
    j = {
        {"Name", e.name},
        {"Type", e.isDirectory() ? 1 : 0},
        {"Size", e.size},
        {"Hash", e.hash}
    };
}

std::vector<Entry> mfsync::store::model::entriesFromListing(const nlohmann::json& j) {
    std::vector<Entry> entries;
    const auto it = j.find("Entries");
    if (it == j.end() || it->is_null()) return entries;

    entries.reserve(it->size());
    for (const auto& item : *it) entries.push_back(item.get<Entry>());
    return entries;
}
