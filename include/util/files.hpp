#pragma once

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace mfsync::util {

inline std::string readFileToString(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(static_cast<size_t>(size), '\0');
    if (!in.read(buffer.data(), size))
        throw std::runtime_error("Failed to read file: " + path.string());
    in.close();

    return buffer;
}

// Write to a sibling temp file, then rename over the target.
inline void writeFileAtomically(const std::filesystem::path& path, const std::string& content) {
    auto tmp = path;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error("Failed to open file for writing: " + tmp.string());
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.close();
        if (!out) throw std::runtime_error("Failed to write file: " + tmp.string());
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        const auto reason = ec.message();
        std::filesystem::remove(tmp, ec);
        throw std::runtime_error("Failed to replace " + path.string() + ": " + reason);
    }
}

}
