/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/Logger.hpp"

#include <cctype>
#include <filesystem>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <utility>

#ifndef DEBUG
#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <fstream>
#include <vector>
#include <boost/container/flat_map.hpp>
#endif

namespace GridAgents {
namespace {

constexpr const char* DEFAULT_SESSION = "default";
constexpr const char* LOG_PREFIX = "gridagents_";

std::mutex g_sessionMutex;
std::string g_session = DEFAULT_SESSION;

std::tm localTime(std::time_t t) {
    std::tm timeinfo{};
#ifdef _WIN32
    localtime_s(&timeinfo, &t);
#else
    localtime_r(&t, &timeinfo);
#endif
    return timeinfo;
}

} // anonymous namespace

void Logger::SetSession(const std::string& source) {
    // "layouts/maze.json" and "maze" both log as "maze"
    std::string name = std::filesystem::path(source).stem().string();
    for (char& c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '-' && c != '_') {
            c = '_';
        }
    }
    if (name.empty()) {
        name = DEFAULT_SESSION;
    }

    std::lock_guard<std::mutex> lock(g_sessionMutex);
    g_session = std::move(name);
}

std::string Logger::SessionName() {
    std::lock_guard<std::mutex> lock(g_sessionMutex);
    return g_session;
}

std::string Logger::LogFileName(const std::string& session, std::time_t started) {
    const std::tm timeinfo = localTime(started);
    std::ostringstream filename;
    filename << LOG_PREFIX << session << '_' << std::put_time(&timeinfo, "%Y%m%d_%H%M%S")
             << ".log";
    return filename.str();
}

// Debug builds print inline from the header; only release builds need a sink
#ifndef DEBUG
namespace {

constexpr size_t MAX_LOG_FILES = 5;
constexpr size_t FLUSH_INTERVAL = 50;

// Release builds keep console output clean; failures are recorded on disk
class FileLogger {
public:
    static FileLogger& Instance() {
        static FileLogger instance;
        return instance;
    }

    void write(const char* level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_fileMutex);

        if (!m_initialized) {
            initialize();
        }

        if (!m_fileStream.is_open()) {
            return;
        }

        // Format: YYYY-MM-DD HH:MM:SS.mmm [LEVEL] [SYSTEM] message
        auto now = std::chrono::system_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                  1000;
        std::tm timeinfo = localTime(std::chrono::system_clock::to_time_t(now));

        m_fileStream << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << '.'
                     << std::setfill('0') << std::setw(3) << ms.count() << " ["
                     << level << "] [" << system << "] " << message << '\n';

        ++m_recordsBySystem[system];
        ++m_messageCount;

        if (std::strcmp(level, "CRITICAL") == 0 || m_messageCount >= FLUSH_INTERVAL) {
            m_fileStream.flush();
            m_messageCount = 0;
        }
    }

private:
    FileLogger() = default;

    ~FileLogger() {
        if (m_fileStream.is_open()) {
            // which parts of the simulation failed, at a glance
            m_fileStream << "\n=== " << m_session << " summary ===\n";
            for (const auto& [system, count] : m_recordsBySystem) {
                m_fileStream << system << ": " << count << '\n';
            }
            m_fileStream.flush();
            m_fileStream.close();
        }
    }

    FileLogger(const FileLogger&) = delete;
    FileLogger& operator=(const FileLogger&) = delete;

    void initialize() {
        m_initialized = true;

        // GRIDAGENTS_APP_NAME is defined via CMake from ${PROJECT_NAME}
        char* prefPath = SDL_GetPrefPath("GridAgents", GRIDAGENTS_APP_NAME);
        if (prefPath == nullptr) {
            return;
        }

        namespace fs = std::filesystem;
        fs::path logDir = fs::path(prefPath) / "logs";
        SDL_free(prefPath);

        std::error_code ec;
        fs::create_directories(logDir, ec);
        if (ec) {
            return;
        }

        cleanOldLogs(logDir);

        const std::time_t started =
            std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        const std::tm timeinfo = localTime(started);
        m_session = Logger::SessionName();

        m_fileStream.open(logDir / Logger::LogFileName(m_session, started),
                          std::ios::out | std::ios::app);

        if (m_fileStream.is_open()) {
            m_fileStream << "=== " << GRIDAGENTS_APP_NAME << " Log (" << m_session << ") ===\n";
            m_fileStream << "Started: "
                         << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S")
                         << "\n\n";
            m_fileStream.flush();
        }
    }

    // Keeps the newest MAX_LOG_FILES - 1 so the new file makes MAX_LOG_FILES
    void cleanOldLogs(const std::filesystem::path& logDir) {
        namespace fs = std::filesystem;

        std::vector<fs::directory_entry> logFiles;

        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(logDir, ec)) {
            if (entry.path().extension() == ".log" &&
                entry.path().filename().string().starts_with(LOG_PREFIX)) {
                logFiles.push_back(entry);
            }
        }

        if (logFiles.size() < MAX_LOG_FILES) {
            return;
        }

        // Oldest first
        std::sort(logFiles.begin(), logFiles.end(),
                  [](const fs::directory_entry& a, const fs::directory_entry& b) {
                      return fs::last_write_time(a) < fs::last_write_time(b);
                  });

        const size_t toRemove = logFiles.size() - (MAX_LOG_FILES - 1);
        for (size_t i = 0; i < toRemove; ++i) {
            fs::remove(logFiles[i].path(), ec);
        }
    }

    std::mutex m_fileMutex;
    std::ofstream m_fileStream;
    std::string m_session;
    boost::container::flat_map<std::string, size_t> m_recordsBySystem;
    bool m_initialized = false;
    size_t m_messageCount = 0;
};

} // anonymous namespace

void Logger::Log(const char* level, const char* system,
                 const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(const char* level, const char* system, const char* message) {
    if (s_quietMode.load(std::memory_order_relaxed)) {
        return;
    }
    FileLogger::Instance().write(level, system, message);
}
#endif // ifndef DEBUG

} // namespace GridAgents
