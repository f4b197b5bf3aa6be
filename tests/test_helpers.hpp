#pragma once

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

// Fresh directory per test under a symlink-free temp root
class TempDirTest : public ::testing::Test {
   protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = fs::canonical(fs::temp_directory_path()) /
                   ("promfile_" + std::string(info->test_suite_name()) + "_" + info->name() + "_" +
                    std::to_string(getpid()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    fs::path test_dir;
};

inline void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    ASSERT_TRUE(out.is_open()) << "cannot open " << path;
    out << content;
}

// Adds to the end without truncating: a single IN_MODIFY
inline void append_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::app);
    ASSERT_TRUE(out.is_open()) << "cannot open " << path;
    out << content;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Repoints `link` the way a mounted config volume update does:
// new link beside it, then rename() over the old one
inline void swap_symlink(const fs::path& link, const fs::path& new_target) {
    fs::path temp_link = link;
    temp_link += ".tmp";
    fs::create_symlink(new_target, temp_link);
    fs::rename(temp_link, link);
}

// Polls `predicate` until it holds or `timeout` passes
template <typename Predicate>
bool eventually(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}
