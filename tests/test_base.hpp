#pragma once

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include "logging/logger.hpp"

/**
 * @brief Base class for tests that need a scratch directory
 *
 * Every test gets its own directory under the system temp path, removed
 * again in TearDown.
 */
class TestBase : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("DEBUG");

        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("clipbot_test_" + std::to_string(getpid()) + "_" + info->test_suite_name() + "_" + info->name());
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    std::string testDir() const { return test_dir_.string(); }

    std::string pathFor(const std::string &name) const { return (test_dir_ / name).string(); }

    std::string createFile(const std::string &name, const std::string &content = "dummy content")
    {
        std::string path = pathFor(name);
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    // Write an executable /bin/sh script and return its path
    std::string createScript(const std::string &name, const std::string &body)
    {
        std::string path = createFile(name, "#!/bin/sh\n" + body + "\n");
        chmod(path.c_str(), 0755);
        return path;
    }

    static std::string readFile(const std::string &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    // Number of entries directly inside dir
    static size_t countEntries(const std::string &dir)
    {
        size_t count = 0;
        for (const auto &entry : std::filesystem::directory_iterator(dir))
        {
            (void)entry;
            ++count;
        }
        return count;
    }

private:
    std::filesystem::path test_dir_;
};
