#pragma once

#include "sync/model/LogFile.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace hs::sync {

class Scanner {
public:
    static constexpr auto LOG_EXTENSION = ".jsonl";
    static constexpr auto HIDDEN_DIR_EXCEPTION = ".claude";

    explicit Scanner(std::vector<std::string> excludePatterns = {});
    virtual ~Scanner() = default;

    /**
     * Walks root recursively and returns every candidate log file, sorted by
     * path. Hidden directories are pruned (except `.claude`); unreadable
     * subdirectories are skipped. Throws ScanError only when root itself
     * can't be read.
     */
    [[nodiscard]] std::vector<model::LogFile> scan(const std::filesystem::path& root) const;

    // Basename glob match or plain substring of the full path.
    [[nodiscard]] bool isExcluded(const std::filesystem::path& path) const;

    static std::string projectPathFor(const std::filesystem::path& relPath);
    static std::string sessionIdFor(const std::string& fileName);

protected:
    // Opens one directory for listing. Overridden in tests.
    virtual std::filesystem::directory_iterator openDirectory(const std::filesystem::path& dir,
                                                              std::error_code& ec) const;

private:
    std::vector<std::string> excludePatterns_;

    static bool isPrunedDirectory(const std::string& name);

    void walk(const std::filesystem::path& root, const std::filesystem::path& dir,
              std::vector<model::LogFile>& out) const;
};

}
