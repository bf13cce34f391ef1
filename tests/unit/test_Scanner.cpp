#include <gtest/gtest.h>
#include "TempDir.hpp"
#include "sync/Scanner.hpp"
#include "sync/errors.hpp"

#include <algorithm>
#include <set>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace hs::sync;
using namespace hs::sync::model;

namespace {

// Fails to open any directory named in `unreadable`, whoever runs the test.
class FailingOpenScanner : public Scanner {
public:
    using Scanner::Scanner;

    std::set<std::string> unreadable;

protected:
    fs::directory_iterator openDirectory(const fs::path& dir, std::error_code& ec) const override {
        if (unreadable.contains(dir.filename().string())) {
            ec = std::make_error_code(std::errc::permission_denied);
            return {};
        }
        return Scanner::openDirectory(dir, ec);
    }
};

}

class ScannerTest : public hs::test::TempDirTest {
protected:
    static std::vector<std::string> sessionIds(const std::vector<LogFile>& files) {
        std::vector<std::string> ids;
        for (const auto& f : files) ids.push_back(f.session_id);
        return ids;
    }
};

TEST_F(ScannerTest, ExcludePatternMatchesBasename) {
    write("keep.jsonl");
    write("exclude-me.jsonl");

    const auto files = Scanner({"exclude-me*"}).scan(root);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].session_id, "keep");
    EXPECT_EQ(files[0].path, root / "keep.jsonl");
}

TEST_F(ScannerTest, ExcludePatternMatchesPathSubstring) {
    write("projA/one.jsonl");
    write("private-stuff/two.jsonl");

    const auto files = Scanner({"private-stuff"}).scan(root);
    EXPECT_EQ(sessionIds(files), std::vector<std::string>{"one"});
}

TEST_F(ScannerTest, OnlyLogExtensionIsCollected) {
    write("a.jsonl", "{}\n");
    write("b.json");
    write("c.txt");
    write("d.jsonl.bak");

    EXPECT_EQ(sessionIds(Scanner().scan(root)), std::vector<std::string>{"a"});
}

TEST_F(ScannerTest, HiddenDirectoriesArePrunedExceptClaude) {
    write(".git/objects/x.jsonl");
    write(".cache/y.jsonl");
    write(".claude/projects/z.jsonl");
    write("visible/w.jsonl");

    auto ids = sessionIds(Scanner().scan(root));
    std::ranges::sort(ids);
    EXPECT_EQ(ids, (std::vector<std::string>{"w", "z"}));
}

TEST_F(ScannerTest, HiddenRootIsStillWalked) {
    const auto hidden = root / ".hidden-root";
    write(".hidden-root/s.jsonl");

    const auto files = Scanner().scan(hidden);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].project_path, "/");
}

TEST_F(ScannerTest, ProjectPathDerivation) {
    write("top.jsonl");
    write("-Users-me-proj/session-1.jsonl");
    write("a/b/c/deep.jsonl");

    const auto files = Scanner().scan(root);
    ASSERT_EQ(files.size(), 3u);

    for (const auto& f : files) {
        if (f.session_id == "top") EXPECT_EQ(f.project_path, "/");
        else if (f.session_id == "session-1") EXPECT_EQ(f.project_path, "/-Users-me-proj");
        else if (f.session_id == "deep") EXPECT_EQ(f.project_path, "/a/b/c");
        else ADD_FAILURE() << "unexpected session " << f.session_id;
    }
}

TEST_F(ScannerTest, ResultsAreSortedAndCarryFileMetadata) {
    write("b/2.jsonl", "0123456789");
    write("a/1.jsonl", "abc");

    const auto files = Scanner().scan(root);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_LT(files[0].path, files[1].path);
    EXPECT_EQ(files[0].size, 3u);
    EXPECT_EQ(files[1].size, 10u);
    EXPECT_GT(files[0].mod_time, 0);
}

TEST_F(ScannerTest, MissingRootThrowsScanError) {
    EXPECT_THROW((void)Scanner().scan(root / "does-not-exist"), ScanError);
}

TEST_F(ScannerTest, RootThatIsAFileThrowsScanError) {
    const auto f = write("plain.jsonl");
    EXPECT_THROW((void)Scanner().scan(f), ScanError);
}

TEST_F(ScannerTest, UnreadableSubdirectoryIsSkipped) {
    if (::geteuid() == 0) GTEST_SKIP() << "permission bits are not enforced for root";

    write("ok/good.jsonl");
    write("locked/hidden.jsonl");
    fs::permissions(root / "locked", fs::perms::none, fs::perm_options::replace);

    std::vector<LogFile> files;
    EXPECT_NO_THROW(files = Scanner().scan(root));
    fs::permissions(root / "locked", fs::perms::owner_all, fs::perm_options::replace);

    EXPECT_EQ(sessionIds(files), std::vector<std::string>{"good"});
}

TEST_F(ScannerTest, DirectoryThatFailsToOpenIsSkipped) {
    write("a/one.jsonl");
    write("locked/hidden.jsonl");
    write("locked/inner/deeper.jsonl");
    write("z/two.jsonl");

    FailingOpenScanner scanner;
    scanner.unreadable = {"locked"};

    std::vector<LogFile> files;
    ASSERT_NO_THROW(files = scanner.scan(root));
    EXPECT_EQ(sessionIds(files), (std::vector<std::string>{"one", "two"}));
}

TEST_F(ScannerTest, RootThatFailsToOpenThrowsScanError) {
    write("projects/s.jsonl");

    FailingOpenScanner scanner;
    scanner.unreadable = {"projects"};
    EXPECT_THROW((void)scanner.scan(root / "projects"), ScanError);
}

TEST(ScannerHelpersTest, SessionIdStripsExtension) {
    EXPECT_EQ(Scanner::sessionIdFor("abc-123.jsonl"), "abc-123");
    EXPECT_EQ(Scanner::sessionIdFor("noext"), "noext");
}
