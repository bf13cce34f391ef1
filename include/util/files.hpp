#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace hs::util {

// Like create_directories, but every directory it creates ends up 0700.
// Directories that already exist are left alone.
inline void createPrivateDirectories(const std::filesystem::path& dir) {
    namespace fs = std::filesystem;

    std::vector<fs::path> missing;
    std::error_code ec;
    for (auto p = dir; !p.empty() && !fs::exists(p, ec); p = p.parent_path()) {
        if (ec) throw std::runtime_error("Failed to stat " + p.string() + ": " + ec.message());
        missing.push_back(p);
        if (p == p.parent_path()) break;
    }
    if (ec) throw std::runtime_error("Failed to stat " + dir.string() + ": " + ec.message());

    for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
        fs::create_directory(*it, ec);
        if (ec) throw std::runtime_error("Failed to create directory " + it->string() + ": " + ec.message());
        fs::permissions(*it, fs::perms::owner_all, fs::perm_options::replace, ec);
        if (ec) throw std::runtime_error("Failed to restrict permissions on " + it->string() + ": " + ec.message());
    }
}

}
