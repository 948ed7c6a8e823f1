/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TEMP_DIRECTORY_HPP
#define TEMP_DIRECTORY_HPP

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

// Scratch directory removed when the fixture ends
class TempDirectory {
public:
    explicit TempDirectory(const std::string& prefix = "lifeline_test") {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = std::filesystem::temp_directory_path() /
                 (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(m_path);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& path() const { return m_path; }

    std::filesystem::path operator/(const std::string& name) const { return m_path / name; }

    void writeFile(const std::string& name, const std::string& content) const {
        std::ofstream file(m_path / name, std::ios::binary | std::ios::trunc);
        file << content;
    }

    std::string readFile(const std::string& name) const {
        std::ifstream file(m_path / name, std::ios::binary);
        std::ostringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    bool exists(const std::string& name) const {
        return std::filesystem::exists(m_path / name);
    }

private:
    std::filesystem::path m_path;
};

#endif // TEMP_DIRECTORY_HPP
