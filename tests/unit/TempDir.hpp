#pragma once

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

namespace hs::test {

// Fresh directory per test, removed on teardown.
class TempDirTest : public ::testing::Test {
protected:
    std::filesystem::path root;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root = std::filesystem::temp_directory_path() / "histsync-tests"
               / (std::string(info->test_suite_name()) + "." + info->name());
        std::filesystem::remove_all(root);
        std::filesystem::create_directories(root);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::permissions(root, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::add, ec);
        std::filesystem::remove_all(root, ec);
    }

    std::filesystem::path write(const std::filesystem::path& rel, const std::string& content = "") const {
        const auto p = root / rel;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream(p, std::ios::binary) << content;
        return p;
    }
};

inline std::string legacyLine(const std::string& uuid, const std::string& content = "hello",
                              const std::string& role = "user") {
    return R"({"uuid":")" + uuid + R"(","timestamp":"2025-01-01T00:00:00Z","role":")" + role
           + R"(","content":")" + content + R"("})";
}

}
