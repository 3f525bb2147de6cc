#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <format>
#include <fstream>
#include <string>

#include <unistd.h>

namespace plantsim::test
{
    // scratch directory named after the running test, removed on scope exit
    class TempDir
    {
    public:
        TempDir()
        {
            const auto* info{ ::testing::UnitTest::GetInstance()->current_test_info() };
            auto name{ info ? std::format("{}_{}", info->test_suite_name(), info->name()) : std::string{ "plantsim" } };
            m_path = std::filesystem::temp_directory_path() / std::format("plantsim_{}_{}", name, ::getpid());
            std::filesystem::remove_all(m_path);
            std::filesystem::create_directories(m_path);
        }

        ~TempDir()
        {
            std::error_code ignored;
            std::filesystem::remove_all(m_path, ignored);
        }

        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        std::string file(const std::string& name) const { return (m_path / name).string(); }

        std::string write(const std::string& name, const std::string& content) const
        {
            auto path{ file(name) };
            std::ofstream out(path, std::ios::trunc);
            out << content;
            return path;
        }

    private:
        std::filesystem::path m_path;
    };
}
