/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only; debug builds log to the console from the header
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace Lifeline {
namespace {

namespace fs = std::filesystem;

constexpr size_t RETAINED_LOGS = 5;
constexpr size_t FLUSH_EVERY = 50;
constexpr const char* LOG_PREFIX = "lifeline_";

std::string formatNow(const char* format, bool withMillis) {
    auto now = std::chrono::system_clock::now();
    auto timeNow = std::chrono::system_clock::to_time_t(now);
    std::tm timeinfo{};
    localtime_r(&timeNow, &timeinfo);

    std::ostringstream out;
    out << std::put_time(&timeinfo, format);
    if (withMillis) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) % 1000;
        out << '.' << std::setfill('0') << std::setw(3) << ms.count();
    }
    return out.str();
}

// Per-user location used when the host never named a log directory
fs::path prefLogDirectory() {
    char* prefPath = SDL_GetPrefPath("HammerForged", LIFELINE_APP_NAME);
    if (prefPath == nullptr) {
        return {};
    }
    fs::path directory = fs::path(prefPath) / "logs";
    SDL_free(prefPath);
    return directory;
}

// Deletes the oldest session logs so that at most keep remain
void pruneSessions(const fs::path& directory, size_t keep) {
    std::error_code ec;
    std::vector<fs::directory_entry> sessions;
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        const std::string name = entry.path().filename().string();
        if (entry.path().extension() == ".log" && name.starts_with(LOG_PREFIX)) {
            sessions.push_back(entry);
        }
    }
    if (sessions.size() <= keep) {
        return;
    }

    std::sort(sessions.begin(), sessions.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.last_write_time() < b.last_write_time();
              });
    for (size_t i = 0; i + keep < sessions.size(); ++i) {
        fs::remove(sessions[i].path(), ec);
    }
}

/**
 * One log file per process session. Warnings are buffered; errors and
 * critical messages are flushed immediately so they survive a crash.
 */
class SessionLogFile {
public:
    static SessionLogFile& Instance() {
        static SessionLogFile instance;
        return instance;
    }

    void setDirectory(const fs::path& directory) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (directory == m_directory) {
            return;
        }
        closeFile();
        m_directory = directory;
        m_attempted = false;
    }

    void write(const char* level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_attempted) {
            openFile();
        }
        if (!m_file.is_open()) {
            return;
        }

        m_file << formatNow("%Y-%m-%d %H:%M:%S", true) << " [" << level << "] [" << system
               << "] " << message << '\n';
        if (std::strcmp(level, "WARNING") != 0 || ++m_buffered >= FLUSH_EVERY) {
            m_file.flush();
            m_buffered = 0;
        }
    }

    SessionLogFile(const SessionLogFile&) = delete;
    SessionLogFile& operator=(const SessionLogFile&) = delete;

private:
    SessionLogFile() = default;
    ~SessionLogFile() { closeFile(); }

    void openFile() {
        m_attempted = true;
        fs::path directory = m_directory.empty() ? prefLogDirectory() : m_directory;
        if (directory.empty()) {
            return;
        }

        std::error_code ec;
        fs::create_directories(directory, ec);
        if (ec) {
            return;
        }
        pruneSessions(directory, RETAINED_LOGS - 1);

        const std::string started = formatNow("%Y%m%d_%H%M%S", false);
        m_file.open(directory / (std::string(LOG_PREFIX) + started + ".log"),
                    std::ios::out | std::ios::app);
        if (m_file.is_open()) {
            m_file << "=== " << LIFELINE_APP_NAME << " session " << started << " ===\n";
            m_file.flush();
        }
    }

    void closeFile() {
        if (m_file.is_open()) {
            m_file << "=== session end " << formatNow("%Y-%m-%d %H:%M:%S", false) << " ===\n";
            m_file.close();
        }
        m_buffered = 0;
    }

    std::mutex m_mutex;
    fs::path m_directory;
    std::ofstream m_file;
    bool m_attempted{false};
    size_t m_buffered{0};
};

} // anonymous namespace

void Logger::SetLogDirectory(const std::string& directory) {
    SessionLogFile::Instance().setDirectory(directory);
}

void Logger::Log(const char* level, const char* system, const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(const char* level, const char* system, const char* message) {
    if (s_quietMode.load(std::memory_order_relaxed)) {
        return;
    }
    SessionLogFile::Instance().write(level, system, message);
}

} // namespace Lifeline

#endif // ifndef DEBUG
