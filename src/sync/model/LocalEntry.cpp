#include "sync/model/LocalEntry.hpp"
#include "util/u8.hpp"

#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <sys/stat.h>

using namespace mfsync::sync::model;

LocalEntry LocalEntry::fromPath(const std::filesystem::path& path) {
    struct stat st{};
    if (::lstat(path.c_str(), &st) != 0)
        throw std::filesystem::filesystem_error("lstat failed", path, std::error_code(errno, std::generic_category()));

    LocalEntry e;
    e.path = path;
    e.name = path.filename().string();
    if (!util::isValidUtf8(e.name))
        throw std::runtime_error("Could not parse file name " + path.string() + " as unicode");

    if (S_ISLNK(st.st_mode)) e.type = Type::Symlink;
    else if (S_ISDIR(st.st_mode)) e.type = Type::Directory;
    else if (S_ISREG(st.st_mode)) e.type = Type::File;
    else e.type = Type::Other;

    e.size = static_cast<uint64_t>(st.st_size);
    e.ctime = st.st_ctim.tv_sec;
    return e;
}
