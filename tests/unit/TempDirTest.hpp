#pragma once

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

// Fresh scratch directory per test.
class TempDirTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = fs::temp_directory_path() /
                   ("mvx_test_" + std::to_string(::getpid()) + "_" + info->test_suite_name() + "_" + info->name());
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    static void writeTextFile(const fs::path& path, const std::string& content) {
        if (path.has_parent_path()) fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    static std::string readTextFile(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    // relative path -> content ("<dir>" for directories)
    [[nodiscard]] std::map<std::string, std::string> snapshot() const {
        std::map<std::string, std::string> out;
        for (const auto& e : fs::recursive_directory_iterator(test_dir)) {
            const auto rel = e.path().lexically_relative(test_dir).generic_string();
            out[rel] = e.is_directory() ? "<dir>" : readTextFile(e.path());
        }
        return out;
    }

    static std::string pattern(const size_t size) {
        std::string s(size, '\0');
        for (size_t i = 0; i < size; ++i) s[i] = static_cast<char>('a' + i % 26);
        return s;
    }
};
