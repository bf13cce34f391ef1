#include "sync/Scanner.hpp"
#include "sync/errors.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <fnmatch.h>
#include <sys/stat.h>

namespace fs = std::filesystem;

using namespace hs::sync;
using namespace hs::sync::model;
using namespace hs::logging;

Scanner::Scanner(std::vector<std::string> excludePatterns)
    : excludePatterns_(std::move(excludePatterns)) {}

bool Scanner::isPrunedDirectory(const std::string& name) {
    return name.starts_with('.') && name != "." && name != HIDDEN_DIR_EXCEPTION;
}

bool Scanner::isExcluded(const fs::path& path) const {
    const auto base = path.filename().string();
    const auto full = path.string();

    return std::ranges::any_of(excludePatterns_, [&](const std::string& pattern) {
        return fnmatch(pattern.c_str(), base.c_str(), 0) == 0
            || full.find(pattern) != std::string::npos;
    });
}

std::string Scanner::projectPathFor(const fs::path& relPath) {
    const auto dir = relPath.parent_path();
    if (dir.empty() || dir == ".") return "/";
    return "/" + dir.generic_string();
}

std::string Scanner::sessionIdFor(const std::string& fileName) {
    const std::string ext = LOG_EXTENSION;
    if (fileName.size() >= ext.size() && fileName.ends_with(ext))
        return fileName.substr(0, fileName.size() - ext.size());
    return fileName;
}

fs::directory_iterator Scanner::openDirectory(const fs::path& dir, std::error_code& ec) const {
    return fs::directory_iterator(dir, ec);
}

void Scanner::walk(const fs::path& root, const fs::path& dir, std::vector<LogFile>& out) const {
    std::error_code ec;
    auto it = openDirectory(dir, ec);
    if (ec) {
        if (dir == root) throw ScanError("reading scan root " + root.string() + ": " + ec.message());
        LogRegistry::scan()->warn("[Scanner] Skipping unreadable directory {}: {}", dir.string(), ec.message());
        return;
    }

    std::vector<fs::path> subdirs;

    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            LogRegistry::scan()->warn("[Scanner] Error listing {}: {}", dir.string(), ec.message());
            break;
        }

        const auto& entry = *it;
        const auto name = entry.path().filename().string();

        std::error_code typeEc;
        if (entry.symlink_status(typeEc).type() == fs::file_type::directory) {
            if (!isPrunedDirectory(name)) subdirs.push_back(entry.path());
            continue;
        }

        if (!name.ends_with(LOG_EXTENSION)) continue;
        if (isExcluded(entry.path())) continue;

        LogFile file{
            .path = entry.path(),
            .project_path = projectPathFor(entry.path().lexically_relative(root)),
            .session_id = sessionIdFor(name),
        };

        if (struct stat st{}; ::stat(entry.path().c_str(), &st) == 0) {
            file.mod_time = st.st_mtime;
            file.size = static_cast<std::uintmax_t>(st.st_size);
        }

        out.push_back(std::move(file));
    }

    std::ranges::sort(subdirs);
    for (const auto& sub : subdirs) walk(root, sub, out);
}

std::vector<LogFile> Scanner::scan(const fs::path& root) const {
    std::error_code ec;
    if (!fs::is_directory(root, ec))
        throw ScanError("scan root " + root.string() + " is not a readable directory"
                        + (ec ? ": " + ec.message() : ""));

    std::vector<LogFile> files;
    walk(root, root, files);

    std::ranges::sort(files, {}, &LogFile::path);
    LogRegistry::scan()->debug("[Scanner] Found {} log files under {}", files.size(), root.string());
    return files;
}
