#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <string>

namespace mfsync::sync::model {

struct LocalEntry {
    enum class Type { File, Directory, Symlink, Other };

    std::string name;
    std::filesystem::path path;
    Type type{Type::Other};
    uint64_t size{};
    std::time_t ctime{};

    // lstat()s the path; symlinks are reported as such, never followed.
    static LocalEntry fromPath(const std::filesystem::path& path);

    [[nodiscard]] bool isFile() const { return type == Type::File; }
    [[nodiscard]] bool isDirectory() const { return type == Type::Directory; }
    [[nodiscard]] bool isSymlink() const { return type == Type::Symlink; }
};

}
