/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>
#include <vector>

namespace TesselEngine {
namespace {

#ifndef DEBUG
namespace fs = std::filesystem;

std::tm localTime(std::time_t time) {
  std::tm timeinfo{};
#ifdef _WIN32
  localtime_s(&timeinfo, &time);
#else
  localtime_r(&time, &timeinfo);
#endif
  return timeinfo;
}

// strftime into a fixed buffer, "" on overflow
std::string formatTime(const std::tm &timeinfo, const char *pattern) {
  char buffer[32];
  const size_t written = std::strftime(buffer, sizeof(buffer), pattern, &timeinfo);
  return std::string(buffer, written);
}

/**
 * @brief Timestamped log file, opened on the first write
 *
 * Older tessel_*.log files beyond the retention count are removed when the
 * file is opened.
 */
class LogFile {
public:
  void configure(const std::string &directory, size_t keepFiles) {
    if (m_opened) {
      return;
    }
    m_directory = directory;
    m_keepFiles = std::max<size_t>(keepFiles, 1);
  }

  void write(const char *level, const char *system, const char *message) {
    if (!m_opened) {
      open();
    }
    if (!m_stream.is_open()) {
      return;
    }

    const auto now = std::chrono::system_clock::now();
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()) % 1000;
    const std::tm timeinfo = localTime(std::chrono::system_clock::to_time_t(now));

    // YYYY-MM-DD HH:MM:SS.mmm [LEVEL] [System] message
    m_stream << std::format("{}.{:03} [{}] [{}] {}\n",
                            formatTime(timeinfo, "%Y-%m-%d %H:%M:%S"),
                            millis.count(), level, system, message);
    m_stream.flush();
  }

private:
  void open() {
    m_opened = true;

    std::error_code ec;
    fs::create_directories(m_directory, ec);
    if (ec) {
      std::fprintf(stderr, "Tessel Engine - cannot create log directory %s\n",
                   m_directory.string().c_str());
      return;
    }

    pruneOldLogs();

    const std::tm timeinfo = localTime(std::time(nullptr));
    const fs::path path =
        m_directory / std::format("tessel_{}.log", formatTime(timeinfo, "%Y%m%d_%H%M%S"));
    m_stream.open(path, std::ios::out | std::ios::app);
    if (m_stream.is_open()) {
      m_stream << "=== Tessel Engine Log, started "
               << formatTime(timeinfo, "%Y-%m-%d %H:%M:%S") << " ===\n";
    }
  }

  void pruneOldLogs() {
    std::vector<fs::directory_entry> logs;
    std::error_code ec;
    for (const auto &entry : fs::directory_iterator(m_directory, ec)) {
      const std::string name = entry.path().filename().string();
      if (entry.path().extension() == ".log" && name.starts_with("tessel_")) {
        logs.push_back(entry);
      }
    }
    if (logs.size() < m_keepFiles) {
      return;
    }

    // Oldest first; one slot stays free for the file about to be opened
    std::sort(logs.begin(), logs.end(),
              [](const fs::directory_entry &a, const fs::directory_entry &b) {
                return a.last_write_time() < b.last_write_time();
              });
    const size_t excess = logs.size() - m_keepFiles + 1;
    for (size_t i = 0; i < excess; ++i) {
      fs::remove(logs[i].path(), ec);
    }
  }

  fs::path m_directory{"logs"};
  size_t m_keepFiles{5};
  std::ofstream m_stream;
  bool m_opened{false};
};

LogFile &logFile() {
  static LogFile file;
  return file;
}
#endif // ifndef DEBUG

std::mutex &logMutex() {
  static std::mutex mutex;
  return mutex;
}

} // anonymous namespace

const char *logLevelName(LogLevel level) {
  switch (level) {
  case LogLevel::CRITICAL:
    return "CRITICAL";
  case LogLevel::ERROR_LEVEL:
    return "ERROR";
  case LogLevel::WARNING:
    return "WARNING";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::DEBUG_LEVEL:
    return "DEBUG";
  default:
    return "UNKNOWN";
  }
}

std::optional<LogLevel> parseLogLevel(std::string_view name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "critical")
    return LogLevel::CRITICAL;
  if (lower == "error")
    return LogLevel::ERROR_LEVEL;
  if (lower == "warning" || lower == "warn")
    return LogLevel::WARNING;
  if (lower == "info")
    return LogLevel::INFO;
  if (lower == "debug")
    return LogLevel::DEBUG_LEVEL;
  return std::nullopt;
}

void Logger::SetLogDirectory(const std::string &directory, size_t keepFiles) {
#ifdef DEBUG
  (void)directory;
  (void)keepFiles;
#else
  std::lock_guard<std::mutex> lock(logMutex());
  logFile().configure(directory, keepFiles);
#endif
}

void Logger::Log(LogLevel level, const char *system, const char *message) {
  if (!IsEnabled(level)) {
    return;
  }

  std::lock_guard<std::mutex> lock(logMutex());
#ifdef DEBUG
  std::printf("Tessel Engine - [%s] %s: %s\n", system, logLevelName(level), message);
  std::fflush(stdout);
#else
  logFile().write(logLevelName(level), system, message);
#endif
}

} // namespace TesselEngine
