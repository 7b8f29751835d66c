#pragma once

#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

// fresh scratch directory per test, removed afterwards
class TreeFixture : public ::testing::Test {
protected:
    fs::path test_dir;
    std::ostringstream log_sink;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = fs::temp_directory_path() /
                   ("fscmp_" + std::string(info->test_suite_name()) + "_" + info->name() + "_" +
                    std::to_string(::getpid()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::permissions(test_dir, fs::perms::owner_all, fs::perm_options::add, ec);
        fs::remove_all(test_dir, ec);
    }

    fs::path writeFile(const fs::path& rel, const std::string& content) {
        const auto path = test_dir / rel;
        fs::create_directories(path.parent_path());
        std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
        ofs << content;
        return path;
    }
};
